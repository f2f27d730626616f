#include "internal/maintenance/job_queue.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/core/record_codec.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recall::maintenance {

using db::model::MaintenanceJobRecord;
using namespace recall::memory::v1;

namespace {

constexpr uint32_t kCommitAttempts = 5;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  if (result.code == db::ErrorCode::NotFound) throw util::NotFound(context);
  throw std::runtime_error(result.Describe(context));
}

} // namespace

JobQueue::JobQueue(std::shared_ptr<db::Repository> repository, JobQueuePolicy policy)
    : repository_(std::move(repository)), policy_(policy) {
  if (!repository_) {
    throw std::invalid_argument("JobQueue: repository is required");
  }
  if (policy_.max_attempts == 0) policy_.max_attempts = 1;
}

std::string JobQueue::Enqueue(JobType type, const std::string& owner_id, const std::string& payload_json,
                              uint64_t scheduled_for_ms, const std::string& depends_on) {
  const auto now = util::ToUnixMillis(util::Now());

  MaintenanceJobRecord job;
  job.id               = util::NewId();
  job.job_type         = type;
  job.status           = JOB_STATUS_PENDING;
  job.owner_id         = owner_id;
  job.payload_json     = payload_json.empty() ? "{}" : payload_json;
  job.max_attempts     = policy_.max_attempts;
  job.scheduled_for_ms = scheduled_for_ms != 0 ? scheduled_for_ms : now;
  job.depends_on       = depends_on;
  job.created_at_ms    = now;

  db::RunWithCommitRetry(*repository_, kCommitAttempts, [&](db::Transaction& tx) {
    if (!depends_on.empty() && !repository_->GetJob(tx, depends_on)) {
      throw util::NotFound("dependency job not found: " + depends_on);
    }
    ThrowIfDbError(repository_->InsertJob(tx, job), "enqueue job");
  });

  RECALL_LOG_INFO("job enqueued", {observability::StringField("job_id", job.id),
                                   observability::StringField("job_type", core::JobTypeName(type)),
                                   observability::StringField("owner_id", owner_id),
                                   observability::StringField("depends_on", depends_on)});
  Notify();
  return job.id;
}

std::optional<MaintenanceJobRecord> JobQueue::ClaimNext(uint64_t now_ms) {
  std::lock_guard<std::mutex> claim(claim_mutex_);

  std::optional<MaintenanceJobRecord> claimed;
  std::vector<MaintenanceJobRecord>   cascaded;
  std::size_t                         pending_count = 0;
  std::size_t                         running_count = 0;

  db::RunWithCommitRetry(*repository_, kCommitAttempts, [&](db::Transaction& tx) {
    claimed.reset();
    cascaded.clear();

    const auto running = repository_->ListJobs(tx, JOB_STATUS_RUNNING);
    const auto pending = repository_->ListJobs(tx, JOB_STATUS_PENDING);
    pending_count      = pending.size();
    running_count      = running.size();

    std::unordered_set<std::string> busy_owners;
    for (const auto& job : running) busy_owners.insert(job.owner_id);

    for (const auto& job : pending) {
      if (job.scheduled_for_ms > now_ms) continue;
      if (busy_owners.count(job.owner_id)) continue;

      if (!job.depends_on.empty()) {
        auto dependency = repository_->GetJob(tx, job.depends_on);
        if (dependency && dependency->status == JOB_STATUS_FAILED) {
          auto failed            = job;
          failed.status          = JOB_STATUS_FAILED;
          failed.last_error      = "dependency " + job.depends_on + " failed";
          failed.completed_at_ms = now_ms;
          ThrowIfDbError(repository_->UpdateJob(tx, failed), "fail dependent job");
          cascaded.push_back(std::move(failed));
          continue;
        }
        if (dependency && dependency->status != JOB_STATUS_DONE) continue;
      }

      auto next          = job;
      next.status        = JOB_STATUS_RUNNING;
      next.attempts      = job.attempts + 1;
      next.started_at_ms = now_ms;
      ThrowIfDbError(repository_->UpdateJob(tx, next), "claim job");
      claimed = std::move(next);
      break;
    }
  });

  for (const auto& job : cascaded) {
    RECALL_LOG_ERROR("job failed", {observability::StringField("job_id", job.id),
                                    observability::StringField("job_type", core::JobTypeName(job.job_type)),
                                    observability::StringField("owner_id", job.owner_id),
                                    observability::StringField("error", job.last_error)});
  }

  if (claimed) {
    --pending_count;
    ++running_count;
  }
  pending_count -= std::min(pending_count, cascaded.size());
  observability::Metrics::Instance().SetJobQueueDepth("pending", pending_count);
  observability::Metrics::Instance().SetJobQueueDepth("running", running_count);
  return claimed;
}

void JobQueue::Complete(const std::string& id, uint64_t now_ms) {
  db::RunWithCommitRetry(*repository_, kCommitAttempts, [&](db::Transaction& tx) {
    auto job = repository_->GetJob(tx, id);
    if (!job) throw util::NotFound("job not found: " + id);
    job->status          = JOB_STATUS_DONE;
    job->completed_at_ms = now_ms;
    job->last_error.clear();
    ThrowIfDbError(repository_->UpdateJob(tx, *job), "complete job");
  });
  Notify();
}

MaintenanceJobRecord JobQueue::Fail(const std::string& id, const std::string& error, uint64_t now_ms) {
  MaintenanceJobRecord updated;
  db::RunWithCommitRetry(*repository_, kCommitAttempts, [&](db::Transaction& tx) {
    auto job = repository_->GetJob(tx, id);
    if (!job) throw util::NotFound("job not found: " + id);

    updated            = *job;
    updated.last_error = error;
    if (updated.attempts >= updated.max_attempts) {
      updated.status          = JOB_STATUS_FAILED;
      updated.completed_at_ms = now_ms;
    } else {
      const auto shift         = std::min<uint32_t>(updated.attempts, 20);
      const auto backoff       = static_cast<uint64_t>(policy_.backoff_base.count()) << shift;
      updated.status           = JOB_STATUS_PENDING;
      updated.scheduled_for_ms = now_ms + backoff;
    }
    ThrowIfDbError(repository_->UpdateJob(tx, updated), "fail job");
  });

  if (updated.status == JOB_STATUS_FAILED) {
    RECALL_LOG_ERROR("job failed", {observability::StringField("job_id", updated.id),
                                    observability::StringField("job_type", core::JobTypeName(updated.job_type)),
                                    observability::StringField("owner_id", updated.owner_id),
                                    observability::IntField("attempts", updated.attempts),
                                    observability::StringField("error", error)});
  } else {
    RECALL_LOG_WARN("job attempt failed; rescheduled",
                    {observability::StringField("job_id", updated.id), observability::IntField("attempts", updated.attempts),
                     observability::IntField("retry_at_ms", static_cast<std::int64_t>(updated.scheduled_for_ms)),
                     observability::StringField("error", error)});
  }
  Notify();
  return updated;
}

std::optional<MaintenanceJobRecord> JobQueue::Get(const std::string& id) {
  auto tx = repository_->Begin();
  return repository_->GetJob(*tx, id);
}

std::vector<MaintenanceJobRecord> JobQueue::List(std::optional<JobStatus> status) {
  auto tx = repository_->Begin();
  return repository_->ListJobs(*tx, status);
}

bool JobQueue::HasOpenJob(const std::string& owner_id, JobType type) {
  auto tx = repository_->Begin();
  for (auto status : {JOB_STATUS_PENDING, JOB_STATUS_RUNNING}) {
    for (const auto& job : repository_->ListJobs(*tx, status)) {
      if (job.owner_id == owner_id && job.job_type == type) return true;
    }
  }
  return false;
}

std::size_t JobQueue::RecoverStale() {
  std::size_t recovered = 0;
  db::RunWithCommitRetry(*repository_, kCommitAttempts, [&](db::Transaction& tx) {
    recovered = 0;
    for (auto job : repository_->ListJobs(tx, JOB_STATUS_RUNNING)) {
      job.status = JOB_STATUS_PENDING;
      ThrowIfDbError(repository_->UpdateJob(tx, job), "recover job");
      ++recovered;
    }
  });
  if (recovered > 0) {
    RECALL_LOG_WARN("recovered interrupted jobs", {observability::IntField("jobs", static_cast<std::int64_t>(recovered))});
    Notify();
  }
  return recovered;
}

bool JobQueue::WaitForWork(std::chrono::milliseconds timeout) {
  std::unique_lock lock(wait_mutex_);
  const auto       seen = generation_;
  cv_.wait_for(lock, timeout, [&] { return shutdown_ || generation_ != seen; });
  return !shutdown_;
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(wait_mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool JobQueue::IsShutdown() const {
  std::lock_guard lock(wait_mutex_);
  return shutdown_;
}

void JobQueue::Notify() {
  {
    std::lock_guard lock(wait_mutex_);
    ++generation_;
  }
  cv_.notify_all();
}

} // namespace recall::maintenance
