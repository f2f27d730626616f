#include "text.hpp"

#include <cctype>
#include <cmath>

namespace recall::util {

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::string NormalizeKey(std::string_view s) {
  // SQL trim() strips spaces only.
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && s[begin] == ' ') ++begin;
  while (end > begin && s[end - 1] == ' ') --end;
  return ToLower(s.substr(begin, end - begin));
}

std::vector<std::string> Tokenize(std::string_view s) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || uc >= 0x80) {
      current.push_back(static_cast<char>(uc < 0x80 ? std::tolower(uc) : uc));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

std::string NormalizeText(std::string_view s) {
  std::string out;
  for (const auto& token : Tokenize(s)) {
    if (!out.empty()) out.push_back(' ');
    out += token;
  }
  return out;
}

std::string JoinSentences(std::string_view a, std::string_view b) {
  auto head = Trim(a);
  auto tail = Trim(b);
  if (head.empty()) return tail;
  if (tail.empty()) return head;
  while (!head.empty() && (head.back() == '.' || head.back() == ' ')) head.pop_back();
  return head + ". " + tail;
}

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) return 0.0;
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na <= 0.0 || nb <= 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::size_t EstimateTokens(std::string_view text) {
  if (text.empty()) return 0;
  return (text.size() + 3) / 4;
}

} // namespace recall::util
