/*
 * @file        inkstone/src/include/concurrency/thread_pool.hpp
 * @brief       A fixed-size thread pool for blocking archive work
 * @author      ChatGPT
 * @date        2025-03-19
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 ChatGPT
 */

// Copyright (c) 2025 ChatGPT
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace inkstone {
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  void Submit(std::function<void()> task);

  /**
   * @brief Submit a callable and get a future for its result. An exception thrown by the
   *        callable is stored in the future instead of reaching the worker thread.
   */
  template <typename F>
  auto SubmitTask(F&& func) -> std::future<std::invoke_result_t<F>> {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
    auto fut  = task->get_future();
    Submit([task]() { (*task)(); });
    return fut;
  }

  auto ThreadCount() const -> size_t { return workers.size(); }

 private:
  std::queue<std::function<void()>> tasks;
  std::mutex                        mtx;
  std::condition_variable           condition;
  std::vector<std::thread>          workers;

  bool                              stop;

  void                              WorkerThread();
};
};  // namespace inkstone
