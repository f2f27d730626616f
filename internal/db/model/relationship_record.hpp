#pragma once

#include <cstdint>
#include <string>

namespace recall::db::model {

// Co-access link between two records; record_a < record_b.
struct RelationshipRecord {
  std::string owner_id;
  std::string record_a;
  std::string record_b;
  uint64_t    co_access_count = 0;
  double      strength        = 0.0;
  uint64_t    updated_at_ms   = 0;
};

} // namespace recall::db::model
