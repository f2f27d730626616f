#include "internal/extraction/fact_extractor.hpp"

#include <algorithm>
#include <regex>

#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace recall::extraction {

using recall::memory::v1::CandidateFact;
using recall::memory::v1::ExtractionRequest;
using recall::memory::v1::ExtractionResponse;

namespace {

const std::vector<std::regex>& SecretPatterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
        std::regex(R"(\b(password|passwd|passphrase|passcode|pin code|pin number)\b\s*(is|was|:|=))", flags),
        std::regex(R"(\b(api[ _-]?key|secret[ _-]?key|access[ _-]?token|auth[ _-]?token)\b\s*(is|was|:|=))", flags),
        std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", flags),
        std::regex(R"(\b(social security|ssn|passport|driver'?s licen[cs]e)\s*(number|no\.?|#)?\s*(is|was|:|=)?\s*(?=[A-Z0-9-]*\d)[A-Z0-9-]{6,})",
                   flags),
        std::regex(R"(\b(sk|pk|rk)[-_](live[-_]|test[-_])?[A-Za-z0-9]{16,})"),
        std::regex(R"(\bAKIA[0-9A-Z]{16}\b)"),
        std::regex(R"(\bgh[pousr]_[A-Za-z0-9]{20,})"),
        std::regex(R"(\bxox[abpr]-[A-Za-z0-9-]{10,})"),
        std::regex(R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)"),
    };
  }();
  return patterns;
}

bool PassesLuhn(const std::string& digits) {
  int  sum       = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int d = *it - '0';
    if (double_it) {
      d *= 2;
      if (d > 9) d -= 9;
    }
    sum += d;
    double_it = !double_it;
  }
  return sum % 10 == 0;
}

bool ContainsCardNumber(const std::string& text) {
  static const std::regex card(R"((?:\d[ -]?){12,18}\d)");
  for (auto it = std::sregex_iterator(text.begin(), text.end(), card); it != std::sregex_iterator(); ++it) {
    std::string digits;
    for (char c : it->str()) {
      if (c >= '0' && c <= '9') digits.push_back(c);
    }
    if (digits.size() >= 13 && digits.size() <= 19 && PassesLuhn(digits)) return true;
  }
  return false;
}

// Cuts at max_chars without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& s, std::size_t max_chars) {
  if (max_chars == 0 || s.size() <= max_chars) return s;
  std::size_t cut = max_chars;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return util::Trim(std::string_view(s).substr(0, cut));
}

void Reject(std::string* reason, const char* why) {
  if (reason) *reason = why;
}

} // namespace

FactExtractor::FactExtractor(std::shared_ptr<collaborator::CollaboratorClient> client, collaborator::CallPolicy policy,
                             std::size_t max_content_chars)
    : client_(std::move(client)), policy_(policy), max_content_chars_(max_content_chars) {
}

double FactExtractor::ImportanceFromLabel(const std::string& label) {
  const auto key = util::NormalizeKey(label);
  if (key == "critical") return 1.0;
  if (key == "high") return 0.8;
  if (key == "low") return 0.3;
  if (key == "trivial") return 0.1;
  return 0.5;
}

bool FactExtractor::ContainsSecret(const std::string& text) {
  if (text.empty()) return false;
  for (const auto& pattern : SecretPatterns()) {
    if (std::regex_search(text, pattern)) return true;
  }
  return ContainsCardNumber(text);
}

std::optional<Candidate> FactExtractor::Validate(const CandidateFact& fact, std::size_t max_content_chars, std::string* reason) {
  Candidate c;

  auto kind = core::ParseKind(fact.kind());
  if (!kind) {
    Reject(reason, "unknown kind");
    return std::nullopt;
  }
  c.kind = *kind;

  c.subject_name     = util::Trim(fact.subject_name());
  c.content          = TruncateUtf8(util::Trim(fact.content()), max_content_chars);
  c.predicate        = util::Trim(fact.predicate());
  c.object           = util::Trim(fact.object());
  c.forget_requested = fact.forget_requested();

  if (c.subject_name.empty()) {
    Reject(reason, "empty subject");
    return std::nullopt;
  }
  if (c.content.empty() && !c.forget_requested) {
    Reject(reason, "empty content");
    return std::nullopt;
  }
  if (ContainsSecret(c.subject_name) || ContainsSecret(c.content) || ContainsSecret(c.object)) {
    Reject(reason, "secret material");
    return std::nullopt;
  }

  // Unrecognized labels are treated as sensitive rather than surfaced.
  c.sensitivity = core::ParseSensitivity(fact.sensitivity()).value_or(recall::memory::v1::SENSITIVITY_SENSITIVE);

  c.is_historical = fact.is_historical();
  c.importance    = ImportanceFromLabel(fact.importance());
  if (fact.has_sentiment()) {
    c.sentiment = std::clamp(fact.sentiment().value(), -1.0, 1.0);
  }

  c.effective_from_ms = fact.has_effective_from() ? util::ProtoToMillis(fact.effective_from()) : 0;
  c.expires_at_ms     = fact.has_expires_at() ? util::ProtoToMillis(fact.expires_at()) : 0;
  if (c.expires_at_ms != 0 && c.effective_from_ms != 0 && c.expires_at_ms <= c.effective_from_ms) {
    c.expires_at_ms = 0;
  }

  if (fact.has_recurrence() && !fact.recurrence().frequency().empty()) {
    c.recurrence_json = util::ToJson(fact.recurrence());
  }

  c.wire = fact;
  c.wire.set_kind(std::string(core::KindName(c.kind)));
  c.wire.set_subject_name(c.subject_name);
  c.wire.set_content(c.content);
  c.wire.set_predicate(c.predicate);
  c.wire.set_object(c.object);
  c.wire.set_sensitivity(std::string(core::SensitivityName(c.sensitivity)));
  if (c.sentiment) c.wire.mutable_sentiment()->set_value(*c.sentiment);
  if (c.expires_at_ms == 0) c.wire.clear_expires_at();
  return c;
}

std::vector<Candidate> FactExtractor::Extract(const std::string& text, const std::vector<std::string>& known_entities) {
  observability::SpanScope span("recall.extract");

  std::vector<Candidate> out;
  if (util::Trim(text).empty()) {
    return out;
  }

  ExtractionRequest request;
  request.set_text(text);
  for (const auto& entity : known_entities) request.add_known_entities(entity);

  ExtractionResponse response;
  try {
    collaborator::Invoke(client_, collaborator::kExtractFactsTool, request, &response, policy_);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RECALL_LOG_WARN("extraction unavailable; no candidates", {observability::StringField("error", e.what())});
    return out;
  }

  std::size_t dropped = 0;
  for (const auto& fact : response.candidates()) {
    std::string reason;
    auto        candidate = Validate(fact, max_content_chars_, &reason);
    if (!candidate) {
      ++dropped;
      RECALL_LOG_DEBUG("dropped candidate", {observability::StringField("reason", reason), observability::ContentField("content", fact.content())});
      continue;
    }
    out.push_back(std::move(*candidate));
  }

  span.SetAttribute("candidates", static_cast<std::int64_t>(out.size()));
  RECALL_LOG_INFO("extracted candidates", {observability::IntField("accepted", static_cast<std::int64_t>(out.size())),
                                           observability::IntField("dropped", static_cast<std::int64_t>(dropped))});
  return out;
}

} // namespace recall::extraction
