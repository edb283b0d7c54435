#pragma once

#include <string_view>

#ifndef LANSHARE_VERSION
#define LANSHARE_VERSION "v1.0.0"
#endif

namespace lanshare {

inline constexpr std::string_view kLanShareVersion = LANSHARE_VERSION;

}  // namespace lanshare
