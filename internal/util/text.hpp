#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace recall::util {

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);

// Slot key form of a subject or predicate: trimmed, ASCII-lowercased.
// Must stay in sync with lower(trim(x)) in the SQL backends.
std::string NormalizeKey(std::string_view s);

// Comparison form of free text: lowercase alphanumeric words joined by single
// spaces, trailing punctuation dropped.
std::string NormalizeText(std::string_view s);

// Lowercase alphanumeric words.
std::vector<std::string> Tokenize(std::string_view s);

// "<a>. <b>" without doubling the terminal period of a.
std::string JoinSentences(std::string_view a, std::string_view b);

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// ~4 characters per token, at least 1 for non-empty text.
std::size_t EstimateTokens(std::string_view text);

} // namespace recall::util
