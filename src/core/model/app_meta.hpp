#pragma once

#include <cstdint>
#include <string_view>

#ifndef TOKENVEST_APP_VERSION
#define TOKENVEST_APP_VERSION "0.3.0"
#endif

#ifndef TOKENVEST_BUILD_RELEASE
#define TOKENVEST_BUILD_RELEASE "Linear Vesting Core"
#endif

#ifndef TOKENVEST_AUTHOR_LIST
#define TOKENVEST_AUTHOR_LIST "tokenvest contributors"
#endif

namespace tokenvest {

inline constexpr std::string_view kAppDisplayName = "tokenvest::Linear Token Vesting Ledger";
inline constexpr std::string_view kConfigFileName = "tokenvest.conf";
inline constexpr std::string_view kPassphraseEnvVar = "TOKENVEST_PASSPHRASE";
inline constexpr std::uint64_t kSecondsPerDay = 86400ULL;
inline constexpr std::uint64_t kMaxVestingDurationSeconds = 100ULL * 365ULL * kSecondsPerDay;
inline constexpr std::size_t kMaxIdentityBytes = 128;
inline constexpr std::string_view kAppVersion = TOKENVEST_APP_VERSION;
inline constexpr std::string_view kBuildRelease = TOKENVEST_BUILD_RELEASE;
inline constexpr std::string_view kAuthorList = TOKENVEST_AUTHOR_LIST;

}  // namespace tokenvest
