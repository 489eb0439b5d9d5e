#pragma once

#include <memory>
#include <string>

#include "internal/model/log_record.hpp"
#include "service_context.hpp"
#include "tracelens/v1.hpp"

namespace tracelens::service {

class LogAnalysisService {
 public:
  explicit LogAnalysisService(ServiceContext ctx);

  tracelens::v1::ExtractLogPatternsResponse ExtractLogPatterns(const tracelens::v1::ExtractLogPatternsRequest& req);

  tracelens::v1::CompareLogWindowsResponse CompareLogWindows(const tracelens::v1::CompareLogWindowsRequest& req);

  // Content fingerprint of every record's severity and message, prefixed
  // with "id:<window_id>:" when the window names itself and "fp:" otherwise.
  static std::string CacheKey(const model::LogWindow& window);

 private:
  // Mined pattern set of a window, served from the cache when present.
  std::shared_ptr<const MinedWindow> Mine(const model::LogWindow& window) const;

  ServiceContext ctx_;
};

} // namespace tracelens::service
