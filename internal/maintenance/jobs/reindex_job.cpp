#include "internal/maintenance/jobs/reindex_job.hpp"

#include <google/protobuf/struct.pb.h>

#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace recall::maintenance {

namespace {

constexpr uint32_t kCommitAttempts = 5;

bool ForceRequested(const std::string& payload_json) {
  if (payload_json.empty()) return false;
  google::protobuf::Struct payload;
  util::FromJson(payload_json, &payload, true);
  auto it = payload.fields().find("force");
  return it != payload.fields().end() && it->second.bool_value();
}

} // namespace

std::vector<db::model::RelationshipRecord> ComputeRelationships(const std::string& owner_id,
                                                                const std::vector<db::model::AccessRecord>& accesses,
                                                                uint64_t now_ms) {
  std::map<std::string, std::set<std::string>> batches;
  for (const auto& a : accesses) batches[a.batch_id].insert(a.record_id);

  std::map<std::string, uint64_t>                              appearances;
  std::map<std::pair<std::string, std::string>, uint64_t> co_access;
  for (const auto& [_, ids] : batches) {
    for (const auto& id : ids) ++appearances[id];
    for (auto a = ids.begin(); a != ids.end(); ++a) {
      for (auto b = std::next(a); b != ids.end(); ++b) ++co_access[{*a, *b}];
    }
  }

  std::vector<db::model::RelationshipRecord> out;
  out.reserve(co_access.size());
  for (const auto& [pair, count] : co_access) {
    db::model::RelationshipRecord r;
    r.owner_id        = owner_id;
    r.record_a        = pair.first;
    r.record_b        = pair.second;
    r.co_access_count = count;
    r.strength        = static_cast<double>(count) /
                 std::sqrt(static_cast<double>(appearances[pair.first]) * static_cast<double>(appearances[pair.second]));
    r.updated_at_ms = now_ms;
    out.push_back(std::move(r));
  }
  return out;
}

ReindexJob::ReindexJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder)
    : store_(std::move(store)), embedder_(std::move(embedder)) {
}

std::string ReindexJob::Run(const JobContext& context) {
  const auto& owner = context.job.owner_id;
  const bool  force = ForceRequested(context.job.payload_json);
  const auto  model = embedder_->ModelName();

  std::size_t reembedded = 0;
  std::size_t skipped    = 0;
  for (const auto& record : store_->ListActive(owner)) {
    if (!force && !record.embedding.empty() && record.embedding_model == model) continue;

    std::vector<float> embedding;
    try {
      embedding = embedder_->EmbedRecord(record.subject_name, record.content);
    } catch (const util::EmbeddingUnavailable& e) {
      throw util::JobFailed(std::string("reindex: ") + e.what());
    }

    core::RecordPatch patch;
    patch.embedding       = std::move(embedding);
    patch.embedding_model = model;
    try {
      store_->Update(record.id, patch, record.revision);
      ++reembedded;
    } catch (const util::SlotConflict&) {
      ++skipped;
    }
  }

  auto repository = store_->Repository();
  std::vector<db::model::AccessRecord> accesses;
  {
    auto tx  = repository->Begin();
    accesses = repository->ListAccesses(*tx, owner);
  }
  const auto relationships = ComputeRelationships(owner, accesses, context.now_ms);
  db::RunWithCommitRetry(*repository, kCommitAttempts, [&](db::Transaction& tx) {
    for (const auto& r : relationships) {
      auto result = repository->UpsertRelationship(tx, r);
      if (!result) throw std::runtime_error(result.Describe("upsert relationship"));
    }
  });

  RECALL_LOG_DEBUG("reindex pass", {observability::StringField("owner_id", owner), observability::BoolField("force", force),
                                    observability::IntField("reembedded", static_cast<std::int64_t>(reembedded)),
                                    observability::IntField("relationships", static_cast<std::int64_t>(relationships.size()))});
  return "reembedded=" + std::to_string(reembedded) + " skipped=" + std::to_string(skipped) +
         " relationships=" + std::to_string(relationships.size());
}

} // namespace recall::maintenance
