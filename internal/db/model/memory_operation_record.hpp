#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "recall/memory/v1/types.pb.h"

namespace recall::db::model {

/*
  Append-only audit row. One per candidate decision or consolidation merge.
*/
struct MemoryOperationRecord {
  std::string id;
  std::string owner_id;

  recall::memory::v1::Operation        operation      = recall::memory::v1::OPERATION_UNSPECIFIED;
  recall::memory::v1::MergeStrategy    merge_strategy = recall::memory::v1::MERGE_STRATEGY_UNSPECIFIED;
  recall::memory::v1::OperationOutcome outcome        = recall::memory::v1::OPERATION_OUTCOME_UNSPECIFIED;

  std::string              candidate_text;
  std::string              candidate_json;
  std::vector<std::string> similar_ids;
  std::string              target_id;
  std::vector<std::string> result_ids;
  std::string              reasoning;

  std::string old_content;
  std::string new_content;
  // Full row contents of a hard-deleted record.
  std::string snapshot_json;

  std::string error;
  std::string job_id;
  std::string source_id;

  uint64_t duration_ms   = 0;
  uint64_t created_at_ms = 0;
};

} // namespace recall::db::model
