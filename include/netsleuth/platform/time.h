#pragma once
#include <cstdint>

namespace netsleuth::platform {

// Wall-clock UNIX time in milliseconds (UTC). 0 if unknown/not set.
// Used for evidence timestamps only; never for timeouts.
std::uint64_t unix_time_ms();

// Monotonic milliseconds since an unspecified epoch (for deadlines).
std::uint64_t monotonic_ms();

// True if we believe the wall clock is valid (i.e. not "unset").
bool time_is_valid();

} // namespace netsleuth::platform
