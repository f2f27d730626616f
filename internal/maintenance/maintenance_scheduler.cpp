#include "internal/maintenance/maintenance_scheduler.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace recall::maintenance {

using namespace recall::memory::v1;

namespace {

struct History {
  uint64_t last_created_ms = 0;
  bool     open            = false;
};

} // namespace

MaintenanceScheduler::MaintenanceScheduler(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<JobQueue> queue,
                                           std::string current_embedding_model, SchedulePolicy policy)
    : store_(std::move(store)), queue_(std::move(queue)), current_model_(std::move(current_embedding_model)), policy_(policy) {
  if (!store_ || !queue_) {
    throw std::invalid_argument("MaintenanceScheduler: store and queue are required");
  }
}

MaintenanceScheduler::~MaintenanceScheduler() {
  Stop();
}

void MaintenanceScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&MaintenanceScheduler::Run, this);
}

void MaintenanceScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void MaintenanceScheduler::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    try {
      Tick(util::ToUnixMillis(util::Now()));
    } catch (const std::exception& e) {
      RECALL_LOG_ERROR("maintenance scheduler tick failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    cv_.wait_for(lock, policy_.tick, [&] { return !running_; });
  }
}

std::size_t MaintenanceScheduler::Tick(uint64_t now_ms) {
  std::map<std::pair<std::string, JobType>, History> history;
  for (const auto& job : queue_->List()) {
    auto& h           = history[{job.owner_id, job.job_type}];
    h.last_created_ms = std::max(h.last_created_ms, job.created_at_ms);
    h.open            = h.open || job.status == JOB_STATUS_PENDING || job.status == JOB_STATUS_RUNNING;
  }

  std::size_t enqueued = 0;
  for (const auto& owner : store_->Owners()) {
    auto due = [&](JobType type, uint64_t period_ms) {
      const auto& h = history[{owner, type}];
      return !h.open && (h.last_created_ms == 0 || now_ms >= h.last_created_ms + period_ms);
    };
    auto open = [&](JobType type) { return history[{owner, type}].open; };

    for (auto type : {JOB_TYPE_DECAY, JOB_TYPE_CLEANUP}) {
      if (due(type, policy_.daily_ms)) {
        queue_->Enqueue(type, owner);
        ++enqueued;
      }
    }

    const auto records = store_->ListActive(owner);

    bool stale_embeddings = false;
    for (const auto& r : records) {
      if (r.embedding.empty() || r.embedding_model != current_model_) {
        stale_embeddings = true;
        break;
      }
    }
    if (!open(JOB_TYPE_REINDEX) && (stale_embeddings || due(JOB_TYPE_REINDEX, policy_.monthly_ms))) {
      queue_->Enqueue(JOB_TYPE_REINDEX, owner);
      ++enqueued;
    }

    if (open(JOB_TYPE_CONSOLIDATE) || open(JOB_TYPE_RESUMMARIZE)) continue;

    const auto since = history[{owner, JOB_TYPE_RESUMMARIZE}].last_created_ms;
    std::map<std::string, uint32_t> fresh;
    for (const auto& r : records) {
      if (r.created_at_ms > since) ++fresh[r.category];
    }
    bool category_full = false;
    for (const auto& [category, count] : fresh) {
      category_full = category_full || count >= policy_.resummarize_min_new_records;
    }

    if (category_full || due(JOB_TYPE_RESUMMARIZE, policy_.weekly_ms)) {
      const auto consolidate = queue_->Enqueue(JOB_TYPE_CONSOLIDATE, owner);
      queue_->Enqueue(JOB_TYPE_RESUMMARIZE, owner, "{}", 0, consolidate);
      enqueued += 2;
    }
  }

  if (enqueued > 0) {
    RECALL_LOG_INFO("maintenance jobs scheduled", {observability::IntField("jobs", static_cast<std::int64_t>(enqueued))});
  }
  return enqueued;
}

} // namespace recall::maintenance
