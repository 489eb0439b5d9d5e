#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace tracelens::model {

struct LogRecord {
  std::optional<util::TimePoint> timestamp;
  std::string                    severity;
  std::string                    message;
  std::string                    resource;
};

struct LogWindow {
  std::string            window_id;
  std::vector<LogRecord> records;
};

/*
  A mined log template and the traffic it absorbed.

  template_tokens holds the generalized token sequence; variable positions
  carry the wildcard placeholder.
*/
struct LogPattern {
  std::uint64_t            cluster_id = 0;
  std::string              pattern_id;
  std::vector<std::string> template_tokens;
  std::uint64_t            count = 0;

  std::map<std::string, std::uint64_t> severity_counts;

  std::optional<util::TimePoint> first_seen;
  std::optional<util::TimePoint> last_seen;

  std::vector<std::string> sample_messages;

  std::string Template() const;
  std::string DominantSeverity() const;
  bool        HasErrorSeverity() const;
};

// Canonical upper-case severity name; WARN -> WARNING, FATAL -> CRITICAL,
// empty -> DEFAULT.
std::string NormalizeSeverity(std::string_view severity);

// DEFAULT=0 ... EMERGENCY=8, unknown names rank as DEFAULT.
int SeverityRank(std::string_view normalized_severity);

} // namespace tracelens::model
