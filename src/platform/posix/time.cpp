#include "netsleuth/platform/time.h"

#include <chrono>
#include <cstdint>

namespace netsleuth::platform {

std::uint64_t unix_time_ms()
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    if (ms <= 0) return 0;
    return static_cast<std::uint64_t>(ms);
}

std::uint64_t monotonic_ms()
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

bool time_is_valid()
{
    // Anything after 2020-01-01 is "valid enough"
    return unix_time_ms() >= 1577836800000ULL;
}

} // namespace netsleuth::platform
