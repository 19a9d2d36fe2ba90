#pragma once

#include <string_view>

#ifndef EXTROPY_APP_VERSION
#define EXTROPY_APP_VERSION "0.3.0"
#endif

#ifndef EXTROPY_BUILD_RELEASE
#define EXTROPY_BUILD_RELEASE "Ledger Core"
#endif

namespace extropy {

inline constexpr std::string_view kAppDisplayName = "extropy-ledger";
inline constexpr std::string_view kTokenSymbol = "$EXTROPY";
inline constexpr std::string_view kAppVersion = EXTROPY_APP_VERSION;
inline constexpr std::string_view kBuildRelease = EXTROPY_BUILD_RELEASE;

}  // namespace extropy
