#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/maintenance_job_record.hpp"

namespace recall::maintenance {

struct JobContext {
  const db::model::MaintenanceJobRecord& job;
  uint64_t                               now_ms = 0;
};

/*
  One maintenance job type.

  Run() must be idempotent: a job can be retried after a partial run or
  re-enqueued by the scheduler. Throwing marks the attempt failed.
*/
class JobHandler {
 public:
  virtual ~JobHandler() = default;

  virtual recall::memory::v1::JobType Type() const = 0;

  // Returns a short human-readable result for the job log.
  virtual std::string Run(const JobContext& context) = 0;
};

} // namespace recall::maintenance
