#include "batchnet/core/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

#include "batchnet/util/text.h"

namespace batchnet::log {

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

static std::atomic<Level> g_threshold{Level::Info};

void set_threshold(Level level) noexcept
{
    g_threshold.store(level, std::memory_order_relaxed);
}

Level threshold() noexcept
{
    return g_threshold.load(std::memory_order_relaxed);
}

std::optional<Level> parse_level(std::string_view name)
{
    const std::string n = util::to_lower(util::trim_ws(name));
    if (n == "error")                  return Level::Error;
    if (n == "warn" || n == "warning") return Level::Warn;
    if (n == "info")                   return Level::Info;
    if (n == "debug")                  return Level::Debug;
    if (n == "verbose")                return Level::Verbose;
    return std::nullopt;
}

const char* level_name(Level level)
{
    switch (level) {
    case Level::Error:   return "error";
    case Level::Warn:    return "warn";
    case Level::Info:    return "info";
    case Level::Debug:   return "debug";
    case Level::Verbose: return "verbose";
    }
    return "info";
}

#if defined(BN_DEBUG)

static bool enabled(Level level)
{
    return static_cast<int>(level) <= static_cast<int>(threshold());
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

static FILE* stream_for(Level level)
{
    return (level == Level::Error || level == Level::Warn) ? stderr : stdout;
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(level) || !fmt) {
        return;
    }
    FILE* out = stream_for(level);

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }
    std::fprintf(stream_for(level), "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(BN_DEBUG)

} // namespace batchnet::log
