#pragma once

#include <cstdint>
#include <string>

namespace recall::db::model {

// One returned record within one retrieval batch.
struct AccessRecord {
  std::string owner_id;
  std::string record_id;
  std::string batch_id;
  uint64_t    accessed_at_ms = 0;
};

} // namespace recall::db::model
