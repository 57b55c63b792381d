#pragma once

#include <string>
#include <string_view>

namespace sqlgate::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr std::string_view kApiPrefix = "/api/v1/";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kHealthPath = "/health";

} // namespace sqlgate::http
