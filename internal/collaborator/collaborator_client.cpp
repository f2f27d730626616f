#include "internal/collaborator/collaborator_client.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/proto_json.hpp"

namespace recall::collaborator {

void Invoke(const std::shared_ptr<CollaboratorClient>& client, const std::string& tool,
            const google::protobuf::Message& request, google::protobuf::Message* response, const CallPolicy& policy) {
  if (!client) {
    throw std::runtime_error(tool + ": no collaborator configured");
  }

  const auto  request_json = util::ToJson(request);
  std::string last_error;

  for (uint32_t attempt = 0; attempt <= policy.max_retries; ++attempt) {
    try {
      auto reply = util::RunWithTimeout([client, tool, request_json] { return client->Call(tool, request_json); },
                                        policy.timeout, tool);
      response->Clear();
      util::FromJson(reply, response, /*ignore_unknown_fields=*/true);
      return;
    } catch (const std::exception& e) {
      last_error = e.what();
    }

    RECALL_LOG_WARN("collaborator call failed", {observability::StringField("tool", tool),
                                                  observability::IntField("attempt", attempt + 1),
                                                  observability::StringField("error", last_error)});
  }

  throw std::runtime_error(tool + ": " + last_error);
}

} // namespace recall::collaborator
