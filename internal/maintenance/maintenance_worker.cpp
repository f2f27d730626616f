#include "internal/maintenance/maintenance_worker.hpp"

#include <stdexcept>

#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace recall::maintenance {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<JobQueue> queue, std::vector<std::shared_ptr<JobHandler>> handlers,
                                     uint32_t threads, std::chrono::milliseconds poll_interval)
    : queue_(std::move(queue)), thread_count_(threads == 0 ? 1 : threads), poll_interval_(poll_interval) {
  if (!queue_) {
    throw std::invalid_argument("MaintenanceWorker: queue is required");
  }
  for (auto& handler : handlers) {
    const auto type = handler->Type();
    handlers_[type] = std::move(handler);
  }
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (running_.exchange(true)) return;
  for (uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&MaintenanceWorker::Run, this);
  }
  RECALL_LOG_INFO("maintenance workers started", {observability::IntField("threads", thread_count_)});
}

void MaintenanceWorker::Stop() {
  if (!running_.exchange(false)) return;
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  RECALL_LOG_INFO("maintenance workers stopped");
}

bool MaintenanceWorker::RunOnce(uint64_t now_ms) {
  auto job = queue_->ClaimNext(now_ms);
  if (!job) return false;
  Execute(*job, now_ms);
  return true;
}

void MaintenanceWorker::Run() {
  while (running_) {
    try {
      if (RunOnce(util::ToUnixMillis(util::Now()))) continue;
    } catch (const std::exception& e) {
      RECALL_LOG_ERROR("maintenance worker error", {observability::StringField("error", e.what())});
    }
    if (!queue_->WaitForWork(poll_interval_)) break;
  }
}

void MaintenanceWorker::Execute(const db::model::MaintenanceJobRecord& job, uint64_t now_ms) {
  const auto               type_name = core::JobTypeName(job.job_type);
  const auto               started   = std::chrono::steady_clock::now();
  observability::SpanScope span("recall.job", job.owner_id);
  span.SetAttribute("job_type", type_name);

  auto it = handlers_.find(job.job_type);
  if (it == handlers_.end()) {
    queue_->Fail(job.id, "no handler for job type " + std::string(type_name), now_ms);
    observability::Metrics::Instance().RecordJob(type_name, false);
    return;
  }

  bool success = false;
  try {
    const auto summary = it->second->Run(JobContext{job, now_ms});
    queue_->Complete(job.id, util::ToUnixMillis(util::Now()));
    success = true;
    RECALL_LOG_INFO("job done", {observability::StringField("job_id", job.id), observability::StringField("job_type", type_name),
                                 observability::StringField("owner_id", job.owner_id),
                                 observability::StringField("result", summary)});
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    queue_->Fail(job.id, e.what(), util::ToUnixMillis(util::Now()));
  }

  span.SetOutcome(success ? "done" : "failed");
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().RecordJob(type_name, success);
  observability::Metrics::Instance().ObserveJobDurationMs(type_name, elapsed);
}

} // namespace recall::maintenance
