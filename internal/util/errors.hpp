#pragma once

#include <stdexcept>
#include <string>

namespace recall::util {

/*
  Central error types.

  Transient collaborator failures (*Unavailable, Timeout) are absorbed at
  their adapter boundary. SlotConflict is retried by the writer with a fresh
  read. InvariantViolation is never retried or repaired.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExtractionUnavailable : public std::runtime_error {
 public:
  explicit ExtractionUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecisionUnavailable : public std::runtime_error {
 public:
  explicit DecisionUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EmbeddingUnavailable : public std::runtime_error {
 public:
  explicit EmbeddingUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SlotConflict : public std::runtime_error {
 public:
  SlotConflict(const std::string& msg, std::string occupant_id = {})
      : std::runtime_error(msg), occupant_id_(std::move(occupant_id)) {
  }

  // Record currently holding the contested slot, when known.
  const std::string& OccupantId() const {
    return occupant_id_;
  }

 private:
  std::string occupant_id_;
};

class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class JobFailed : public std::runtime_error {
 public:
  explicit JobFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Timeout : public std::runtime_error {
 public:
  explicit Timeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OperationCancelled : public std::runtime_error {
 public:
  explicit OperationCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace recall::util
