#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace recall::util {

/*
  Cooperative cancellation flag shared between a caller and a running write.
  Copies observe the same flag.
*/
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() {
    flag_->store(true);
  }

  bool IsCancelled() const {
    return flag_->load();
  }

  void ThrowIfCancelled(const std::string& what) const {
    if (IsCancelled()) throw OperationCancelled(what + ": cancelled");
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace recall::util
