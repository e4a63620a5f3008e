#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string_view>

namespace xfer {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts debug|info|warn|error|none (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view s);

// What precedes the message on each line. The server writes a full prefix,
// the client only the level since it shares the terminal with its progress.
struct LogFormat {
    bool utc_timestamp = true;
    bool source_location = true;
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    void SetFormat(LogFormat fmt);
    LogFormat Format() const;

    // Defaults to stderr. The stream is not owned.
    void SetSink(std::FILE* sink);

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::xfer::Logger::Instance().LogWithSource(::xfer::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::xfer::Logger::Instance().LogWithSource(::xfer::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::xfer::Logger::Instance().LogWithSource(::xfer::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::xfer::Logger::Instance().LogWithSource(::xfer::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace xfer
