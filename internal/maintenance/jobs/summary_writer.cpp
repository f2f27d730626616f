#include "internal/maintenance/jobs/summary_writer.hpp"

#include "internal/util/text.hpp"

namespace recall::maintenance {

std::string ExtractiveSummaryWriter::Write(const std::string& /*category*/, const std::vector<db::model::MemoryRecord>& members,
                                           std::size_t max_chars) {
  std::string out;
  for (const auto& member : members) {
    auto content = util::Trim(member.content);
    if (content.empty()) continue;
    while (!content.empty() && (content.back() == '.' || content.back() == '!' || content.back() == '?')) content.pop_back();

    std::string sentence = util::Trim(member.subject_name);
    sentence += sentence.empty() ? content : ": " + content;
    sentence += ".";

    const std::size_t needed = out.empty() ? sentence.size() : sentence.size() + 1;
    if (max_chars > 0 && out.size() + needed > max_chars) {
      // Always keep at least one member.
      if (!out.empty()) break;
    }
    if (!out.empty()) out += " ";
    out += sentence;
  }
  return out;
}

} // namespace recall::maintenance
