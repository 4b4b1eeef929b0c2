//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/scan_service.hpp"

#include <format>
#include <iostream>

#include "config/scan_settings.hpp"
#include "scanner/archive_inspector.hpp"
#include "scanner/processing_pool.hpp"
#include "scanner/sync_engine.hpp"
#include "scanner/thumbnail_store.hpp"
#include "utils/scan/scan_log.hpp"

namespace inkstone {
namespace {
void CopyCounters(const ProcessingStats& stats, ScanCounters& counters) {
  counters.processed_comics_     = stats.processed_comics_;
  counters.processed_pages_      = stats.processed_pages_;
  counters.page_errors_          = stats.page_errors_;
  counters.processed_thumbnails_ = stats.processed_thumbnails_;
  counters.thumbnail_errors_     = stats.thumbnail_errors_;
  counters.thumb_bytes_written_  = stats.thumb_bytes_written_;
  counters.thumb_bytes_saved_    = stats.thumb_bytes_saved_;
}
}  // namespace

ScanService::ScanService(std::shared_ptr<StorageService> storage,
                         std::shared_ptr<MetadataCache> cache, std::shared_ptr<SearchIndex> search,
                         std::shared_ptr<NsfwClassifier> nsfw, LibraryConfig config)
    : storage_(std::move(storage)),
      cache_(std::move(cache)),
      search_(std::move(search)),
      nsfw_(std::move(nsfw)),
      config_(std::move(config)) {}

ScanService::~ScanService() { Wait(); }

auto ScanService::Start(ScanType type) -> std::optional<job_id_t> {
  std::lock_guard<std::mutex> lock(thread_lock_);
  auto                        job = storage_->GetScanJobController().TryStartJob(type);
  if (!job) {
    std::cout << "[INFO] ScanService: A scan is already running\n";
    return std::nullopt;
  }
  // The previous job is already terminal, its thread is at most finishing up
  if (worker_.joinable()) worker_.join();
  job_id_t id = job->id_;
  worker_     = std::thread(&ScanService::Execute, this, std::move(*job));
  return id;
}

auto ScanService::RunBlocking(ScanType type) -> std::optional<ScanJob> {
  auto job = storage_->GetScanJobController().TryStartJob(type);
  if (!job) return std::nullopt;
  job_id_t id = job->id_;
  Execute(std::move(*job));
  return storage_->GetScanJobController().GetJob(id);
}

void ScanService::Wait() {
  std::lock_guard<std::mutex> lock(thread_lock_);
  if (worker_.joinable()) worker_.join();
}

auto ScanService::RequestCancel() -> bool {
  return storage_->GetScanJobController().RequestCancel();
}

auto ScanService::GetJob(job_id_t id) -> std::optional<ScanJob> {
  return storage_->GetScanJobController().GetJob(id);
}

auto ScanService::GetLatest() -> std::optional<ScanJob> {
  return storage_->GetScanJobController().GetLatest();
}

auto ScanService::RecoverInterrupted() -> int64_t {
  return storage_->GetScanJobController().MarkInterrupted();
}

void ScanService::Publish(ScanJob& job, const ScanLog& log) {
  job.errors_ = log.Lines();
  storage_->GetScanJobController().UpdateProgress(job);
}

void ScanService::Execute(ScanJob job) {
  std::cout << std::format("[INFO] ScanService: Job {} ({}) started\n", job.id_,
                           ToString(job.type_));
  ScanLog    log(config_.max_errors_);
  ScanStatus status = ScanStatus::COMPLETED;
  try {
    RunPhases(job, log);
    if (job.status_ == ScanStatus::CANCELLED) status = ScanStatus::CANCELLED;
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] ScanService: Job {} failed: {}\n", job.id_, e.what());
    job.failure_ = e.what();
    status       = ScanStatus::FAILED;
  } catch (...) {
    std::cerr << std::format("[ERROR] ScanService: Job {} failed with an unknown exception\n",
                             job.id_);
    job.failure_ = "unknown exception";
    status       = ScanStatus::FAILED;
  }

  job.phase_  = ScanPhase::DONE;
  job.errors_ = log.Lines();
  job.current_file_.reset();
  try {
    storage_->GetScanJobController().Finish(job, status);
  } catch (const std::exception& e) {
    // Left running, the next start of the library marks it interrupted
    std::cerr << std::format("[ERROR] ScanService: Cannot record the end of job {}: {}\n",
                             job.id_, e.what());
    return;
  }
  std::cout << std::format(
      "[INFO] ScanService: Job {} {}: {} files, {} new, {} changed, {} deleted, {} processed, "
      "{} error(s)\n",
      job.id_, ToString(status), job.counters_.total_comics_, job.counters_.new_comics_,
      job.counters_.changed_comics_, job.counters_.deleted_comics_,
      job.counters_.processed_comics_, log.Size());
}

void ScanService::RunPhases(ScanJob& job, ScanLog& log) {
  auto& comics = storage_->GetComicController();
  auto& jobs   = storage_->GetScanJobController();

  if (job.type_ == ScanType::RESCAN) {
    comics.WipeLibrary();
    cache_->Invalidate();
    search_->MarkDirty();
    std::cout << "[INFO] ScanService: Library wiped for rescan\n";
  }
  if (job.type_ != ScanType::SYNC_ONLY) {
    auto reset = comics.ResetStaleProcessed();
    if (reset > 0) {
      std::cout << std::format("[INFO] ScanService: {} comic(s) queued for reprocessing\n", reset);
    }
  }

  // Phase 1
  job.phase_ = ScanPhase::SYNC;
  SyncOptions sync_options;
  sync_options.roots_             = config_.roots_;
  sync_options.sidecar_name_      = config_.sidecar_name_;
  sync_options.upsert_batch_size_ = config_.upsert_batch_size_;
  sync_options.progress_interval_ = config_.progress_interval_;
  SyncEngine sync(comics, storage_->GetSeriesController(), sync_options, [this]() {
    cache_->Invalidate();
    search_->MarkDirty();
  });

  auto sync_stats = sync.Run(log, [&](const SyncProgress& progress) {
    job.counters_.total_comics_   = progress.files_seen_;
    job.counters_.new_comics_     = progress.new_comics_;
    job.counters_.changed_comics_ = progress.changed_comics_;
    job.current_file_             = progress.current_file_;
    Publish(job, log);
    return jobs.IsCancelRequested(job.id_);
  });
  job.counters_.total_comics_   = sync_stats.total_files_;
  job.counters_.new_comics_     = sync_stats.new_comics_;
  job.counters_.changed_comics_ = sync_stats.changed_comics_;
  job.counters_.deleted_comics_ = sync_stats.deleted_comics_;
  if (sync_stats.cancelled_) {
    job.status_ = ScanStatus::CANCELLED;
    return;
  }
  if (sync_stats.HasChanges()) nsfw_->RecomputeAll();
  Publish(job, log);

  if (job.type_ == ScanType::SYNC_ONLY) return;

  // Phase 2
  job.phase_                    = ScanPhase::PROCESSING;
  job.counters_.total_comics_   = comics.CountPending();
  auto             settings     = ScanSettings::Load(storage_->GetSettingsController());
  ArchiveInspector inspector(InspectorOptions{settings.thumbnail_, settings.compute_file_hash_});
  ThumbnailStore   store(config_.ThumbnailDir());
  ProcessingPool   pool(comics, ProcessingPool::MakeInspectorWorker(inspector, store),
                        config_.worker_count_, config_.batch_size_);

  auto             processing_stats = pool.Run(log, [&](const ProcessingProgress& progress) {
    CopyCounters(progress.stats_, job.counters_);
    if (!progress.current_file_.empty()) job.current_file_ = progress.current_file_;
    Publish(job, log);
    return jobs.IsCancelRequested(job.id_);
  });
  CopyCounters(processing_stats, job.counters_);
  if (processing_stats.cancelled_) job.status_ = ScanStatus::CANCELLED;
}
};  // namespace inkstone
