#pragma once

#include <cstdint>
#include <string>

#include "recall/memory/v1/types.pb.h"

namespace recall::db::model {

struct MaintenanceJobRecord {
  std::string id;

  recall::memory::v1::JobType   job_type = recall::memory::v1::JOB_TYPE_UNSPECIFIED;
  recall::memory::v1::JobStatus status   = recall::memory::v1::JOB_STATUS_PENDING;

  std::string owner_id;
  std::string payload_json;

  uint32_t attempts     = 0;
  uint32_t max_attempts = 3;

  uint64_t    scheduled_for_ms = 0;
  std::string depends_on;
  std::string last_error;

  uint64_t created_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
};

} // namespace recall::db::model
