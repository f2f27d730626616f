#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/db/model/memory_record.hpp"

namespace recall::maintenance {

// Produces the text of one category summary from its member records.
class SummaryWriter {
 public:
  virtual ~SummaryWriter() = default;

  // members are ordered by importance, highest first.
  virtual std::string Write(const std::string& category, const std::vector<db::model::MemoryRecord>& members,
                            std::size_t max_chars) = 0;
};

/*
  Joins "Subject: content." sentences in member order until max_chars.
  Uses only member text, so the summary never states what no record says.
*/
class ExtractiveSummaryWriter final : public SummaryWriter {
 public:
  std::string Write(const std::string& category, const std::vector<db::model::MemoryRecord>& members,
                    std::size_t max_chars) override;
};

} // namespace recall::maintenance
