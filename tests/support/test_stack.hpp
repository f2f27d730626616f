#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/audit/audit_log.hpp"
#include "internal/core/memory_engine.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/core/update_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/decision/decision_adapter.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/extraction/fact_extractor.hpp"
#include "internal/maintenance/job_queue.hpp"
#include "internal/retrieval/retrieval_composer.hpp"
#include "internal/retrieval/similarity_retriever.hpp"
#include "internal/retrieval/sufficiency_judge.hpp"
#include "internal/retrieval/vector_index.hpp"
#include "internal/util/time.hpp"
#include "support/scripted_collaborator.hpp"
#include "support/scripted_embedding_provider.hpp"

namespace recall::testing {

// Full in-memory engine wired the way the factory wires it.
struct TestStack {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<core::MemoryStore>           store;
  std::shared_ptr<retrieval::VectorIndex>      index;
  std::shared_ptr<ScriptedEmbeddingProvider>   provider;
  std::shared_ptr<embedding::EmbeddingAdapter> embedder;
  std::shared_ptr<ScriptedCollaborator>        collaborator;
  std::shared_ptr<audit::AuditLog>             audit;
  std::shared_ptr<retrieval::SimilarityRetriever> retriever;
  std::shared_ptr<core::UpdateEngine>          updater;
  std::shared_ptr<retrieval::RetrievalComposer> composer;
  std::shared_ptr<maintenance::JobQueue>       queue;
  std::shared_ptr<core::MemoryEngine>          engine;

  explicit TestStack(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>()) {
    repository = std::move(repo);
    store      = std::make_shared<core::MemoryStore>(repository);
    index      = std::make_shared<retrieval::VectorIndex>();
    index->Hydrate(*store);
    store->AddListener(index);

    provider = std::make_shared<ScriptedEmbeddingProvider>();
    embedding::EmbeddingPolicy embedding_policy;
    embedding_policy.timeout     = std::chrono::milliseconds(1000);
    embedding_policy.max_retries = 0;
    embedder = std::make_shared<embedding::EmbeddingAdapter>(provider, embedding_policy);

    collaborator = std::make_shared<ScriptedCollaborator>();
    collaborator::CallPolicy call_policy;
    call_policy.timeout     = std::chrono::milliseconds(1000);
    call_policy.max_retries = 0;

    audit     = std::make_shared<audit::AuditLog>(repository);
    retriever = std::make_shared<retrieval::SimilarityRetriever>(store, index);
    auto decider = std::make_shared<decision::DecisionAdapter>(collaborator, call_policy);
    updater      = std::make_shared<core::UpdateEngine>(store, embedder, retriever, decider, audit, core::UpdatePolicy{});

    composer = std::make_shared<retrieval::RetrievalComposer>(store, embedder, retriever,
                                                              std::make_shared<retrieval::HeuristicSufficiencyJudge>(),
                                                              retrieval::RetrievalPolicy{});

    maintenance::JobQueuePolicy queue_policy;
    queue_policy.backoff_base = std::chrono::milliseconds(10);
    queue                     = std::make_shared<maintenance::JobQueue>(repository, queue_policy);

    auto extractor = std::make_shared<extraction::FactExtractor>(collaborator, call_policy);
    engine = std::make_shared<core::MemoryEngine>(store, extractor, updater, composer, queue, audit);
  }

  // Inserts an active record directly, embedded like the engine would.
  db::model::MemoryRecord Seed(const std::string& owner, recall::memory::v1::MemoryKind kind, const std::string& subject,
                               const std::string& content, const std::string& predicate = {}, double importance = 0.5) {
    db::model::MemoryRecord r;
    r.owner_id        = owner;
    r.kind            = kind;
    r.subject_name    = subject;
    r.content         = content;
    r.predicate       = predicate;
    r.importance      = importance;
    r.sensitivity     = recall::memory::v1::SENSITIVITY_NORMAL;
    r.status          = recall::memory::v1::RECORD_STATUS_ACTIVE;
    r.category        = "general";
    r.embedding       = embedder->EmbedRecord(subject, content);
    r.embedding_model = embedder->ModelName();
    return store->Insert(std::move(r));
  }
};

inline uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

} // namespace recall::testing
