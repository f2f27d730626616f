#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include "internal/maintenance/job_handler.hpp"
#include "internal/maintenance/job_queue.hpp"

namespace recall::maintenance {

/*
  Pool of background threads draining the job queue.

  Each thread claims a job, dispatches it to the handler for its type and
  records the result. Jobs of one owner never overlap (the queue enforces it).
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<JobQueue> queue, std::vector<std::shared_ptr<JobHandler>> handlers, uint32_t threads,
                    std::chrono::milliseconds poll_interval);
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // Claims and runs at most one job on the calling thread.
  bool RunOnce(uint64_t now_ms);

 private:
  void Run();
  void Execute(const db::model::MaintenanceJobRecord& job, uint64_t now_ms);

  std::shared_ptr<JobQueue>                                      queue_;
  std::map<recall::memory::v1::JobType, std::shared_ptr<JobHandler>> handlers_;
  uint32_t                                                       thread_count_;
  std::chrono::milliseconds                                      poll_interval_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace recall::maintenance
