#pragma once

#include <string>

namespace recall::util {

/*
  Identifier minting.

  Memory records, audit entries, jobs and retrieval batches all carry
  random RFC4122 v4 ids in canonical lowercase text form. Ids are opaque:
  nothing orders or parses them.
*/

std::string NewId();

// True for the canonical 8-4-4-4-12 lowercase hex form.
bool IsCanonicalId(const std::string& id);

} // namespace recall::util
