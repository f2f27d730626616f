#include "row_codec.hpp"

#include <charconv>
#include <stdexcept>

namespace recall::db::sql {

std::string JoinList(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (item.find('\n') != std::string::npos) {
      throw std::invalid_argument("list item contains a newline");
    }
    if (!out.empty()) out += '\n';
    out += item;
  }
  return out;
}

std::vector<std::string> SplitList(const std::string& joined) {
  std::vector<std::string> out;
  if (joined.empty()) return out;

  std::size_t start = 0;
  while (true) {
    const auto pos = joined.find('\n', start);
    if (pos == std::string::npos) {
      out.push_back(joined.substr(start));
      break;
    }
    out.push_back(joined.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::string EmbeddingToText(const std::vector<float>& embedding) {
  std::string out;
  char        buf[32];
  for (float v : embedding) {
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) throw std::runtime_error("embedding encode failed");
    if (!out.empty()) out += ' ';
    out.append(buf, end);
  }
  return out;
}

std::vector<float> EmbeddingFromText(const std::string& text) {
  std::vector<float> out;
  const char*        p   = text.data();
  const char*        end = text.data() + text.size();
  while (p < end) {
    while (p < end && *p == ' ') ++p;
    if (p == end) break;
    float v          = 0.0f;
    auto [next, ec]  = std::from_chars(p, end, v);
    if (ec != std::errc()) throw std::runtime_error("embedding decode failed");
    out.push_back(v);
    p = next;
  }
  return out;
}

} // namespace recall::db::sql
