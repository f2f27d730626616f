#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/collaborator/collaborator_client.hpp"
#include "internal/util/proto_json.hpp"
#include "recall/memory/v1.hpp"

namespace recall::testing {

// Collaborator whose replies are produced by per-tool handlers.
class ScriptedCollaborator final : public collaborator::CollaboratorClient {
 public:
  using Handler = std::function<std::string(const std::string& request_json)>;

  void On(const std::string& tool, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[tool] = std::move(handler);
  }

  std::string Call(const std::string& tool, const std::string& request_json) override {
    ++calls_;
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_by_tool_[tool];
      auto it = handlers_.find(tool);
      if (it == handlers_.end()) throw std::runtime_error("no script for " + tool);
      handler = it->second;
    }
    return handler(request_json);
  }

  int Calls() const {
    return calls_.load();
  }

  int CallsTo(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_by_tool_[tool];
  }

 private:
  std::mutex                     mutex_;
  std::map<std::string, Handler> handlers_;
  std::map<std::string, int>     calls_by_tool_;
  std::atomic<int>               calls_{0};
};

inline recall::memory::v1::DecisionRequest ParseDecisionRequest(const std::string& json) {
  recall::memory::v1::DecisionRequest request;
  util::FromJson(json, &request, true);
  return request;
}

inline std::string DecisionJson(const std::string& operation, const std::string& strategy = {},
                                const std::string& target_id = {}, bool same_entity = false) {
  recall::memory::v1::DecisionResponse response;
  response.set_operation(operation);
  response.set_merge_strategy(strategy);
  response.set_target_id(target_id);
  response.set_reasoning("scripted");
  response.set_same_entity(same_entity);
  return util::ToJson(response);
}

inline recall::memory::v1::CandidateFact Fact(const std::string& kind, const std::string& subject, const std::string& content,
                                              const std::string& predicate = {}, const std::string& importance = "medium") {
  recall::memory::v1::CandidateFact fact;
  fact.set_kind(kind);
  fact.set_subject_name(subject);
  fact.set_content(content);
  fact.set_predicate(predicate);
  fact.set_importance(importance);
  return fact;
}

} // namespace recall::testing
