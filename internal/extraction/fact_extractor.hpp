#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/collaborator/collaborator_client.hpp"
#include "internal/extraction/candidate.hpp"

namespace recall::extraction {

/*
  FactExtractor

  text + known entities -> validated candidate facts.

  Extraction is best effort: a collaborator failure, timeout or unparsable
  reply yields an empty list and a warning, never an exception. Candidates
  that fail validation or carry secrets are dropped individually.
*/
class FactExtractor {
 public:
  FactExtractor(std::shared_ptr<collaborator::CollaboratorClient> client, collaborator::CallPolicy policy,
                std::size_t max_content_chars = 2000);

  std::vector<Candidate> Extract(const std::string& text, const std::vector<std::string>& known_entities);

  // Normalizes one wire candidate; nullopt (with reason) if it must be dropped.
  static std::optional<Candidate> Validate(const recall::memory::v1::CandidateFact& fact, std::size_t max_content_chars,
                                           std::string* reason = nullptr);

  // Passwords, government ids, payment card numbers, API keys and private keys.
  static bool ContainsSecret(const std::string& text);

  // critical/high/medium/low/trivial -> 1.0/0.8/0.5/0.3/0.1; anything else 0.5.
  static double ImportanceFromLabel(const std::string& label);

 private:
  std::shared_ptr<collaborator::CollaboratorClient> client_;
  collaborator::CallPolicy                          policy_;
  std::size_t                                       max_content_chars_;
};

} // namespace recall::extraction
