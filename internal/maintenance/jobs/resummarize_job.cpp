#include "internal/maintenance/jobs/resummarize_job.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cstdio>
#include <map>
#include <stdexcept>

#include "internal/core/category_classifier.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/proto_json.hpp"

namespace recall::maintenance {

using db::model::MemoryRecord;
using namespace recall::memory::v1;

namespace {

constexpr uint32_t kCommitAttempts = 5;

std::vector<std::string> RequestedCategories(const std::string& payload_json) {
  if (payload_json.empty()) return core::AllCategories();

  google::protobuf::Struct payload;
  util::FromJson(payload_json, &payload, true);
  auto it = payload.fields().find("categories");
  if (it == payload.fields().end() || !it->second.has_list_value()) return core::AllCategories();

  std::vector<std::string> out;
  for (const auto& value : it->second.list_value().values()) {
    if (value.has_string_value() && !value.string_value().empty()) out.push_back(value.string_value());
  }
  return out;
}

} // namespace

std::string MemberFingerprint(const std::vector<MemoryRecord>& members) {
  std::vector<std::string> keys;
  keys.reserve(members.size());
  for (const auto& m : members) keys.push_back(m.id + ":" + std::to_string(m.revision));
  std::sort(keys.begin(), keys.end());

  uint64_t hash = 1469598103934665603ULL;
  for (const auto& key : keys) {
    for (unsigned char c : key) {
      hash ^= c;
      hash *= 1099511628211ULL;
    }
    hash ^= '|';
    hash *= 1099511628211ULL;
  }

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
  return buf;
}

ResummarizeJob::ResummarizeJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<SummaryWriter> writer,
                               ResummarizePolicy policy)
    : store_(std::move(store)), writer_(std::move(writer)), policy_(policy) {
  if (!writer_) {
    throw std::invalid_argument("ResummarizeJob: summary writer is required");
  }
}

std::string ResummarizeJob::Run(const JobContext& context) {
  const auto& owner = context.job.owner_id;

  std::map<std::string, std::vector<MemoryRecord>> by_category;
  for (auto& r : store_->ListActive(owner)) {
    if (r.sensitivity == SENSITIVITY_PRIVATE) continue;
    by_category[r.category].push_back(std::move(r));
  }

  auto        repository = store_->Repository();
  std::size_t written    = 0;
  std::size_t dropped    = 0;
  std::size_t unchanged  = 0;

  for (const auto& category : RequestedCategories(context.job.payload_json)) {
    auto members = by_category[category];
    std::stable_sort(members.begin(), members.end(), [](const MemoryRecord& a, const MemoryRecord& b) {
      if (a.importance != b.importance) return a.importance > b.importance;
      return a.created_at_ms < b.created_at_ms;
    });
    if (policy_.max_members > 0 && members.size() > policy_.max_members) members.resize(policy_.max_members);

    const auto fingerprint = MemberFingerprint(members);

    std::optional<db::model::CategorySummaryRecord> existing;
    {
      auto tx  = repository->Begin();
      existing = repository->GetCategorySummary(*tx, owner, category);
    }

    if (members.empty()) {
      if (!existing) continue;
      db::RunWithCommitRetry(*repository, kCommitAttempts, [&](db::Transaction& tx) {
        auto result = repository->DeleteCategorySummary(tx, owner, category);
        if (!result) throw std::runtime_error(result.Describe("delete summary"));
      });
      ++dropped;
      continue;
    }

    if (existing && existing->member_fingerprint == fingerprint) {
      ++unchanged;
      continue;
    }

    db::model::CategorySummaryRecord summary;
    summary.owner_id               = owner;
    summary.category               = category;
    summary.summary_text           = writer_->Write(category, members, policy_.max_chars);
    summary.member_fingerprint     = fingerprint;
    summary.last_synthesized_at_ms = context.now_ms;
    for (const auto& m : members) summary.member_record_ids.push_back(m.id);

    db::RunWithCommitRetry(*repository, kCommitAttempts, [&](db::Transaction& tx) {
      auto current    = repository->GetCategorySummary(tx, owner, category);
      summary.version = current ? current->version + 1 : 1;
      auto result     = repository->UpsertCategorySummary(tx, summary);
      if (!result) throw std::runtime_error(result.Describe("upsert summary"));
    });
    ++written;
  }

  RECALL_LOG_DEBUG("resummarize pass", {observability::StringField("owner_id", owner),
                                        observability::IntField("written", static_cast<std::int64_t>(written)),
                                        observability::IntField("dropped", static_cast<std::int64_t>(dropped))});
  return "written=" + std::to_string(written) + " unchanged=" + std::to_string(unchanged) + " dropped=" + std::to_string(dropped);
}

} // namespace recall::maintenance
