#include "netsleuth/core/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace netsleuth::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

#if defined(NS_DEBUG)

static std::atomic<int> g_level{static_cast<int>(Level::Info)};

// Probe threads log concurrently; keep each line whole.
static std::mutex g_out_mutex;

void set_level(Level lvl)
{
    g_level.store(static_cast<int>(lvl));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

static bool enabled(Level lvl)
{
    return static_cast<int>(lvl) <= g_level.load();
}

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

static FILE* stream_for(Level lvl)
{
    return (lvl == Level::Error || lvl == Level::Warn) ? stderr : stdout;
}

void vlogf(Level lvl, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(lvl)) {
        return;
    }

    FILE* out = stream_for(lvl);
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::fprintf(out, "[%s] %s: ", level_to_str(lvl), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level lvl, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(lvl, tag, fmt, args);
    va_end(args);
}

#endif // defined(NS_DEBUG)

} // namespace netsleuth::log
