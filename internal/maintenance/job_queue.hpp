#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace recall::maintenance {

struct JobQueuePolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds backoff_base{1000};
};

/*
  Durable maintenance job queue over the repository.

  Ordering and exclusion rules applied by ClaimNext:
    - only PENDING jobs whose scheduled_for has passed
    - a job whose depends_on is not DONE waits; a FAILED dependency fails it
    - at most one RUNNING job per owner

  A failed run is retried after backoff_base * 2^attempts until max_attempts,
  then the job stays FAILED for operators to inspect.
*/
class JobQueue {
 public:
  JobQueue(std::shared_ptr<db::Repository> repository, JobQueuePolicy policy);

  std::string Enqueue(recall::memory::v1::JobType type, const std::string& owner_id, const std::string& payload_json = "{}",
                      uint64_t scheduled_for_ms = 0, const std::string& depends_on = {});

  std::optional<db::model::MaintenanceJobRecord> ClaimNext(uint64_t now_ms);

  void Complete(const std::string& id, uint64_t now_ms);

  // Returns the row as rescheduled (PENDING) or finally FAILED.
  db::model::MaintenanceJobRecord Fail(const std::string& id, const std::string& error, uint64_t now_ms);

  std::optional<db::model::MaintenanceJobRecord> Get(const std::string& id);

  std::vector<db::model::MaintenanceJobRecord> List(std::optional<recall::memory::v1::JobStatus> status = std::nullopt);

  // True if owner has a PENDING or RUNNING job of this type.
  bool HasOpenJob(const std::string& owner_id, recall::memory::v1::JobType type);

  // Puts RUNNING jobs left by a previous process back to PENDING.
  std::size_t RecoverStale();

  // Waits for an Enqueue/Complete/Fail or the timeout. False once shut down.
  bool WaitForWork(std::chrono::milliseconds timeout);

  void Shutdown();

  bool IsShutdown() const;

 private:
  void Notify();

  std::shared_ptr<db::Repository> repository_;
  JobQueuePolicy                  policy_;

  // Serializes claims between worker threads of this process.
  std::mutex claim_mutex_;

  mutable std::mutex      wait_mutex_;
  std::condition_variable cv_;
  uint64_t                generation_ = 0;
  bool                    shutdown_   = false;
};

} // namespace recall::maintenance
