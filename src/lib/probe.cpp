#include "netsleuth/discovery/probe.h"

#include "netsleuth/platform/time.h"

namespace netsleuth::discovery {

const char* to_string(FailureReason reason) noexcept
{
    switch (reason) {
    case FailureReason::Timeout: return "timeout";
    case FailureReason::Error:   return "error";
    }
    return "unknown";
}

std::uint64_t ProbeContext::remaining_ms() const
{
    const std::uint64_t now = platform::monotonic_ms();
    return now >= _deadlineMs ? 0 : _deadlineMs - now;
}

bool ProbeContext::expired() const
{
    return platform::monotonic_ms() >= _deadlineMs;
}

} // namespace netsleuth::discovery
