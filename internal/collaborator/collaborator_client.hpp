#pragma once

#include <google/protobuf/message.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace recall::collaborator {

/*
  Language-model collaborator abstraction.

  A call names a tool and carries one protobuf message serialized as JSON
  (see proto/recall/memory/v1/contract.proto); the reply is the JSON of the
  tool's response message. Transport, prompting and model choice live
  behind this interface.

  Implementations may block and may throw on any failure.
*/
class CollaboratorClient {
 public:
  virtual ~CollaboratorClient() = default;

  virtual std::string Call(const std::string& tool, const std::string& request_json) = 0;
};

inline constexpr const char* kExtractFactsTool     = "extract_facts";
inline constexpr const char* kDecideUpdateTool     = "decide_update";
inline constexpr const char* kJudgeSufficiencyTool = "judge_sufficiency";

struct CallPolicy {
  std::chrono::milliseconds timeout{30000};
  uint32_t                  max_retries = 2;
};

/*
  Serializes request, calls tool under the policy timeout and parses the reply
  into response (unknown fields ignored). Retries any failure up to
  policy.max_retries times, then rethrows the last error as
  std::runtime_error.
*/
void Invoke(const std::shared_ptr<CollaboratorClient>& client, const std::string& tool,
            const google::protobuf::Message& request, google::protobuf::Message* response, const CallPolicy& policy);

} // namespace recall::collaborator
