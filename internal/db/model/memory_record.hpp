#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "recall/memory/v1/types.pb.h"

namespace recall::db::model {

/*
  Persistent memory row.

  IMPORTANT:
  - `version` counts positions in a supersession chain; it only grows when a
    successor is written.
  - `revision` counts writes to this row and is the optimistic concurrency
    token for Update/Supersede/SoftDelete.
  - Timestamps are Unix millis (0 = unset).
  - `sentiment_average` is bookkeeping like access counters and does not
    bump `revision`.
*/

struct MemoryRecord {
  std::string id;
  std::string owner_id;

  recall::memory::v1::MemoryKind kind = recall::memory::v1::MEMORY_KIND_UNSPECIFIED;

  std::string              subject_name;
  std::string              content;
  std::string              predicate;
  std::string              object;
  std::vector<std::string> aliases;

  std::vector<float> embedding;
  std::string        embedding_model;

  double                importance = 0.5;
  std::optional<double> sentiment;
  // Mean of the subject's most recent sentiment samples.
  std::optional<double> sentiment_average;

  bool is_historical = false;
  bool user_pinned   = false;

  uint64_t    effective_from_ms = 0;
  uint64_t    expires_at_ms     = 0;
  std::string recurrence_json;

  recall::memory::v1::Sensitivity  sensitivity = recall::memory::v1::SENSITIVITY_NORMAL;
  recall::memory::v1::RecordStatus status      = recall::memory::v1::RECORD_STATUS_ACTIVE;

  std::string category;

  std::string supersedes_id;
  std::string superseded_by_id;
  uint64_t    version  = 1;
  uint64_t    revision = 1;

  uint64_t access_count        = 0;
  uint64_t last_accessed_at_ms = 0;
  uint64_t decayed_at_ms       = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

struct MemoryFilter {
  std::string                                     owner_id;
  std::optional<recall::memory::v1::RecordStatus> status;
  std::optional<std::string>                      subject_key;
  std::optional<std::string>                      category;
};

} // namespace recall::db::model
