#pragma once

#include <string>
#include <vector>

namespace recall::db::sql {

/*
  Column encodings shared by the SQL backends.

  String lists (aliases, id lists) are stored newline-joined. Embeddings are a
  raw float BLOB in SQLite and a space-separated decimal list in Postgres.
*/

std::string              JoinList(const std::vector<std::string>& items);
std::vector<std::string> SplitList(const std::string& joined);

std::string        EmbeddingToText(const std::vector<float>& embedding);
std::vector<float> EmbeddingFromText(const std::string& text);

} // namespace recall::db::sql
