#pragma once

#include <cstddef>
#include <string>

namespace codeauditor::http {

inline constexpr const char* kJsonContentType = "application/json";

inline const std::string kAuditPath = "/audit";
inline const std::string kAuditsPath = "/audits";
inline const std::string kAuditByIdPath = "/audits/:id";
inline const std::string kStatsPath = "/stats";

inline constexpr size_t kDefaultPageLimit = 50;
inline constexpr size_t kMaxPageLimit = 500;

} // namespace codeauditor::http
