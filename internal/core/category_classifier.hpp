#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "recall/memory/v1.hpp"

namespace recall::core {

/*
  Deterministic life-area classification.

  A keyword table maps query or record words to one of a fixed set of
  categories. A word matches a keyword when it equals it or extends it by a
  short suffix ("meetings", "planned").
*/

inline constexpr const char* kGeneralCategory = "general";

// All categories, `general` last.
const std::vector<std::string>& AllCategories();

// Best keyword match for a record; falls back to a kind default, then general.
std::string ClassifyCategory(recall::memory::v1::MemoryKind kind, std::string_view text);

// Categories with at least one keyword hit, best first, at most `limit`.
std::vector<std::string> RankCategories(std::string_view query, std::size_t limit);

} // namespace recall::core
