#include "internal/core/category_classifier.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/text.hpp"

namespace recall::core {

using namespace recall::memory::v1;

namespace {

struct CategoryKeywords {
  const char*              category;
  std::vector<std::string> keywords;
};

const std::vector<CategoryKeywords>& Table() {
  static const std::vector<CategoryKeywords> table = {
      {"work_life", {"work", "job", "office", "meeting", "boss", "colleague", "coworker", "career", "company", "startup", "employer", "manager"}},
      {"personal_life", {"home", "weekend", "hobby", "vacation", "relax", "fun", "house", "apartment", "travel", "trip"}},
      {"health_wellness", {"health", "exercise", "workout", "gym", "sleep", "diet", "stress", "therapy", "doctor", "allergic", "allergy", "run"}},
      {"relationships", {"friend", "family", "partner", "spouse", "wife", "husband", "dating", "marriage", "parent", "mother", "father", "child", "daughter", "son", "sister", "brother", "relationship"}},
      {"goals_aspirations", {"goal", "dream", "aspiration", "plan", "future", "ambition", "want", "achieve"}},
      {"preferences", {"like", "love", "prefer", "favorite", "favourite", "enjoy", "hate", "dislike"}},
      {"beliefs_values", {"believe", "think", "value", "important", "principle", "moral", "faith"}},
      {"skills_expertise", {"skill", "expert", "learn", "know", "experience", "talent", "fluent"}},
      {"projects", {"project", "build", "create", "develop", "launch", "ship", "product", "app"}},
      {"challenges", {"challenge", "problem", "struggle", "difficulty", "obstacle", "worry", "stuck"}},
  };
  return table;
}

bool Matches(const std::string& word, const std::string& keyword) {
  if (word.size() < keyword.size() || word.size() > keyword.size() + 3) return false;
  return word.compare(0, keyword.size(), keyword) == 0;
}

std::vector<std::pair<std::size_t, std::size_t>> Score(std::string_view text) {
  const auto words = util::Tokenize(text);

  std::vector<std::pair<std::size_t, std::size_t>> scores; // (table index, hits)
  const auto&                                      table = Table();
  for (std::size_t i = 0; i < table.size(); ++i) {
    std::size_t hits = 0;
    for (const auto& keyword : table[i].keywords) {
      for (const auto& word : words) {
        if (Matches(word, keyword)) {
          ++hits;
          break;
        }
      }
    }
    if (hits > 0) scores.emplace_back(i, hits);
  }
  std::stable_sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
  return scores;
}

} // namespace

const std::vector<std::string>& AllCategories() {
  static const std::vector<std::string> all = [] {
    std::vector<std::string> out;
    for (const auto& entry : Table()) out.emplace_back(entry.category);
    out.emplace_back(kGeneralCategory);
    return out;
  }();
  return all;
}

std::string ClassifyCategory(MemoryKind kind, std::string_view text) {
  const auto scores = Score(text);
  if (!scores.empty()) {
    return Table()[scores.front().first].category;
  }

  switch (kind) {
    case MEMORY_KIND_PREFERENCE:
      return "preferences";
    case MEMORY_KIND_GOAL:
      return "goals_aspirations";
    case MEMORY_KIND_PROCEDURE:
      return "skills_expertise";
    default:
      return kGeneralCategory;
  }
}

std::vector<std::string> RankCategories(std::string_view query, std::size_t limit) {
  std::vector<std::string> out;
  for (const auto& [index, hits] : Score(query)) {
    if (out.size() >= limit) break;
    out.emplace_back(Table()[index].category);
  }
  return out;
}

} // namespace recall::core
