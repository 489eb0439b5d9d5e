#include "internal/logs/token_masker.hpp"

#include <regex>
#include <sstream>

namespace tracelens::logs {

namespace {

constexpr std::string_view kPunctuation = "\"'()[]{}<>,;:!?";

const std::vector<std::regex>& VariablePatterns() {
  static const std::vector<std::regex> kPatterns = {
      // UUID
      std::regex(R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)"),
      // IPv4 with optional port
      std::regex(R"(^\d{1,3}(\.\d{1,3}){3}(:\d+)?$)"),
      // ISO date, optionally with time
      std::regex(R"(^\d{4}-\d{2}-\d{2}([T ]\d{2}:\d{2}(:\d{2}(\.\d+)?)?(Z|[+-]\d{2}:?\d{2})?)?$)"),
      // Time of day
      std::regex(R"(^\d{1,2}:\d{2}(:\d{2}(\.\d+)?)?$)"),
      // Hex identifiers
      std::regex(R"(^(0[xX])?[0-9a-fA-F]{8,}$)"),
      // Numbers, sizes and durations
      std::regex(R"(^[-+]?\d+(\.\d+)?(ns|us|ms|s|m|h|%|b|kb|mb|gb|KB|MB|GB|B)?$)"),
      // Identifiers mixing letters and digits
      std::regex(R"(^(?=[^\s]*\d)(?=[^\s]*[A-Za-z])[A-Za-z0-9_.\-/#]+$)"),
  };
  return kPatterns;
}

bool IsVariable(std::string_view core) {
  if (core.empty()) {
    return false;
  }
  const std::string value(core);
  for (const auto& pattern : VariablePatterns()) {
    if (std::regex_match(value, pattern)) {
      return true;
    }
  }
  return false;
}

std::string MaskCore(std::string_view token) {
  const auto begin = token.find_first_not_of(kPunctuation);
  if (begin == std::string_view::npos) {
    return std::string(token);
  }
  const auto end = token.find_last_not_of(kPunctuation);

  const auto prefix = token.substr(0, begin);
  const auto core   = token.substr(begin, end - begin + 1);
  const auto suffix = token.substr(end + 1);

  if (core == kWildcard || !IsVariable(core)) {
    return std::string(token);
  }
  return std::string(prefix) + std::string(kWildcard) + std::string(suffix);
}

} // namespace

std::string MaskToken(std::string_view token) {
  const auto eq = token.find('=');
  if (eq != std::string_view::npos && eq > 0 && eq + 1 < token.size()) {
    return std::string(token.substr(0, eq + 1)) + MaskCore(token.substr(eq + 1));
  }
  return MaskCore(token);
}

bool IsWildcard(std::string_view token) {
  return token == kWildcard;
}

std::vector<std::string> Tokenize(std::string_view line) {
  std::vector<std::string> tokens;
  std::istringstream       in{std::string(line)};
  std::string              token;
  while (in >> token) {
    tokens.push_back(MaskToken(token));
  }
  return tokens;
}

} // namespace tracelens::logs
