#include "internal/core/category_classifier.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace recall;
using namespace recall::memory::v1;

namespace {

void TestKeywordsDecide() {
  assert(core::ClassifyCategory(MEMORY_KIND_FACT, "Marcus: works at Google") == "work_life");
  assert(core::ClassifyCategory(MEMORY_KIND_FACT, "Anna: goes to the gym every morning") == "health_wellness");
  assert(core::ClassifyCategory(MEMORY_KIND_EVENT, "Mom: my mother visits in June with my sister") == "relationships");
  // Short suffixes still match.
  assert(core::ClassifyCategory(MEMORY_KIND_FACT, "User: had meetings with managers") == "work_life");
}

void TestKindFallbacks() {
  assert(core::ClassifyCategory(MEMORY_KIND_PREFERENCE, "User: window seats") == "preferences");
  assert(core::ClassifyCategory(MEMORY_KIND_GOAL, "User: marathon under four hours") == "goals_aspirations");
  assert(core::ClassifyCategory(MEMORY_KIND_PROCEDURE, "Deploy: tag then push") == "skills_expertise");
  assert(core::ClassifyCategory(MEMORY_KIND_FACT, "Zurich: is in Switzerland") == core::kGeneralCategory);
}

void TestRankCategories() {
  auto ranked = core::RankCategories("what does my boss think about my project at work?", 3);
  assert(!ranked.empty() && ranked.size() <= 3);
  assert(ranked.front() == "work_life");
  assert(std::find(ranked.begin(), ranked.end(), "projects") != ranked.end());

  assert(core::RankCategories("xyzzy", 3).empty());
  assert(core::RankCategories("work gym friend", 2).size() == 2);
}

void TestAllCategoriesEndsWithGeneral() {
  const auto& all = core::AllCategories();
  assert(all.size() == 11);
  assert(all.back() == core::kGeneralCategory);
}

} // namespace

int main() {
  TestKeywordsDecide();
  TestKindFallbacks();
  TestRankCategories();
  TestAllCategoriesEndsWithGeneral();
  std::cout << "category_classifier_test: pass" << std::endl;
  return 0;
}
