#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/core/memory_store.hpp"
#include "internal/maintenance/job_queue.hpp"

namespace recall::maintenance {

struct SchedulePolicy {
  std::chrono::milliseconds tick{60000};

  uint64_t daily_ms   = 24ull * 60 * 60 * 1000;
  uint64_t weekly_ms  = 7 * daily_ms;
  uint64_t monthly_ms = 30 * daily_ms;

  // Records added to one category since the last resummarize that trigger
  // an early consolidate + resummarize pass.
  uint32_t resummarize_min_new_records = 5;
};

/*
  Periodic job planner.

  Per owner, enqueues decay and cleanup daily, consolidate followed by a
  dependent resummarize weekly (or early once a category gathered enough new
  records) and reindex monthly (or as soon as a record carries a different
  embedding model). History comes from the job table, so restarts neither
  skip nor double-schedule work; a type with an open job is never enqueued
  twice.
*/
class MaintenanceScheduler {
 public:
  MaintenanceScheduler(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<JobQueue> queue,
                       std::string current_embedding_model, SchedulePolicy policy);
  ~MaintenanceScheduler();

  void Start();
  void Stop();

  // One planning pass. Returns the number of jobs enqueued.
  std::size_t Tick(uint64_t now_ms);

 private:
  void Run();

  std::shared_ptr<core::MemoryStore> store_;
  std::shared_ptr<JobQueue>          queue_;
  std::string                        current_model_;
  SchedulePolicy                     policy_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace recall::maintenance
