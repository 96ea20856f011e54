#pragma once

#include <cstdarg>

namespace netsleuth::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

#if defined(NS_DEBUG)

// Minimum level that is printed. Defaults to Info.
void set_level(Level level);
Level level();

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);

#else

inline void set_level(Level) {}
inline Level level() { return Level::Error; }

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}


#endif // NS_DEBUG

} // namespace netsleuth::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define NS_ELOG(fmt, ...) ::netsleuth::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(NS_DEBUG)

#define NS_LOGE(tag, fmt, ...) \
    ::netsleuth::log::logf(::netsleuth::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define NS_LOGW(tag, fmt, ...) \
    ::netsleuth::log::logf(::netsleuth::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define NS_LOGI(tag, fmt, ...) \
    ::netsleuth::log::logf(::netsleuth::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define NS_LOGD(tag, fmt, ...) \
    ::netsleuth::log::logf(::netsleuth::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define NS_LOGV(tag, fmt, ...) \
    ::netsleuth::log::logf(::netsleuth::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// Whole invocation (format strings included) disappears at preprocessing time.
#define NS_LOGE(tag, fmt, ...) ((void)0)
#define NS_LOGW(tag, fmt, ...) ((void)0)
#define NS_LOGI(tag, fmt, ...) ((void)0)
#define NS_LOGD(tag, fmt, ...) ((void)0)
#define NS_LOGV(tag, fmt, ...) ((void)0)

#endif // NS_DEBUG
