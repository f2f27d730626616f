#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "recall/memory/v1.hpp"

namespace recall::extraction {

/*
  A validated candidate fact, ready for the update engine.

  `wire` keeps the (normalized) collaborator shape; it is what the decision
  collaborator sees and what the audit log stores.
*/
struct Candidate {
  recall::memory::v1::MemoryKind  kind        = recall::memory::v1::MEMORY_KIND_FACT;
  recall::memory::v1::Sensitivity sensitivity = recall::memory::v1::SENSITIVITY_NORMAL;

  std::string subject_name;
  std::string content;
  std::string predicate;
  std::string object;

  bool                  is_historical = false;
  double                importance    = 0.5;
  std::optional<double> sentiment;
  bool                  forget_requested = false;

  uint64_t    effective_from_ms = 0;
  uint64_t    expires_at_ms     = 0;
  std::string recurrence_json;

  recall::memory::v1::CandidateFact wire;
};

} // namespace recall::extraction
