#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace recall::db::model {

struct CategorySummaryRecord {
  std::string              owner_id;
  std::string              category;
  std::string              summary_text;
  std::vector<std::string> member_record_ids;
  std::string              member_fingerprint;
  uint64_t                 version                = 0;
  uint64_t                 last_synthesized_at_ms = 0;
};

} // namespace recall::db::model
