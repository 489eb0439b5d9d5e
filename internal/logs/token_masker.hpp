#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tracelens::logs {

inline constexpr std::string_view kWildcard = "<*>";

/*
  Splits a log line on whitespace and replaces variable tokens with the
  wildcard: numbers and durations, hex ids, UUIDs, IPv4 addresses, dates,
  times and identifiers mixing letters with digits. For key=value tokens
  only the value is masked. Surrounding punctuation is preserved.
*/
std::vector<std::string> Tokenize(std::string_view line);

std::string MaskToken(std::string_view token);

bool IsWildcard(std::string_view token);

} // namespace tracelens::logs
