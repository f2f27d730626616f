#pragma once

#include <cstdint>
#include <string>

namespace recall::db::model {

// One sentiment reading about a subject, taken from an applied candidate.
struct SentimentSampleRecord {
  std::string owner_id;
  std::string subject_key;
  std::string record_id;
  double      sentiment = 0.0;
  std::string source_id;
  uint64_t    recorded_at_ms = 0;
};

} // namespace recall::db::model
