#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace batchnet::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

// Messages less severe than the threshold are dropped. Defaults to Info.
void set_threshold(Level level) noexcept;
Level threshold() noexcept;

// "error", "warn", "info", "debug" or "verbose", any case.
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level level);

#if defined(BN_DEBUG)

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// Release builds keep the symbols callable but empty.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // BN_DEBUG

} // namespace batchnet::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(BN_DEBUG)

#define BN_ELOG(fmt, ...) ::batchnet::log::early_logf(fmt "\n", ##__VA_ARGS__)

#define BN_LOGE(tag, fmt, ...) \
    ::batchnet::log::logf(::batchnet::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define BN_LOGW(tag, fmt, ...) \
    ::batchnet::log::logf(::batchnet::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define BN_LOGI(tag, fmt, ...) \
    ::batchnet::log::logf(::batchnet::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define BN_LOGD(tag, fmt, ...) \
    ::batchnet::log::logf(::batchnet::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define BN_LOGV(tag, fmt, ...) \
    ::batchnet::log::logf(::batchnet::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole invocation, format string included, disappears at
// preprocessing time.
#define BN_ELOG(fmt, ...) ((void)0)
#define BN_LOGE(tag, fmt, ...) ((void)0)
#define BN_LOGW(tag, fmt, ...) ((void)0)
#define BN_LOGI(tag, fmt, ...) ((void)0)
#define BN_LOGD(tag, fmt, ...) ((void)0)
#define BN_LOGV(tag, fmt, ...) ((void)0)

#endif // BN_DEBUG
