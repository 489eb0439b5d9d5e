#include "internal/model/log_record.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace tracelens::model {

std::string LogPattern::Template() const {
  std::string out;
  for (const auto& token : template_tokens) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += token;
  }
  return out;
}

std::string LogPattern::DominantSeverity() const {
  std::string   dominant = "DEFAULT";
  std::uint64_t best     = 0;
  for (const auto& [severity, count] : severity_counts) {
    if (count > best || (count == best && SeverityRank(severity) > SeverityRank(dominant))) {
      dominant = severity;
      best     = count;
    }
  }
  return dominant;
}

bool LogPattern::HasErrorSeverity() const {
  return std::any_of(severity_counts.begin(), severity_counts.end(),
                     [](const auto& entry) { return entry.second > 0 && SeverityRank(entry.first) >= SeverityRank("ERROR"); });
}

std::string NormalizeSeverity(std::string_view severity) {
  std::string upper;
  upper.reserve(severity.size());
  for (char c : severity) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (upper.empty()) return "DEFAULT";
  if (upper == "WARN") return "WARNING";
  if (upper == "FATAL") return "CRITICAL";
  if (upper == "ERR") return "ERROR";
  return upper;
}

int SeverityRank(std::string_view severity) {
  static constexpr std::string_view kOrder[] = {"DEFAULT", "DEBUG", "INFO", "NOTICE", "WARNING", "ERROR", "CRITICAL", "ALERT", "EMERGENCY"};
  for (int i = 0; i < static_cast<int>(std::size(kOrder)); ++i) {
    if (kOrder[i] == severity) {
      return i;
    }
  }
  return 0;
}

} // namespace tracelens::model
