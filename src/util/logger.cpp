#include "util/logger.hpp"
#include "util/console_line.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace xfer {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<bool> g_utc_timestamp{true};
std::atomic<bool> g_source_location{true};
std::atomic<std::FILE*> g_sink{nullptr};

const char* LevelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return " INFO";
        case LogLevel::Warn:  return " WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "  LOG";
    }
}

// 2026-01-31T12:00:00.123Z
void WriteTimestamp(std::FILE* out) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    if (gmtime_r(&secs, &tm) == nullptr) return;
    char buf[24];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm) == 0) return;
    std::fprintf(out, "%s.%03dZ ", buf, static_cast<int>(millis));
}

std::string_view FileName(const char* file) {
    if (!file) return {};
    std::string_view p(file);
    const auto slash = p.rfind('/');
    return slash == std::string_view::npos ? p : p.substr(slash + 1);
}
} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view s) {
    std::string lower(s);
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug" || lower == "trace") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none" || lower == "off") return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) { g_level.store(lvl, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return g_level.load(std::memory_order_relaxed); }

void Logger::SetFormat(LogFormat fmt) {
    g_utc_timestamp.store(fmt.utc_timestamp, std::memory_order_relaxed);
    g_source_location.store(fmt.source_location, std::memory_order_relaxed);
}

LogFormat Logger::Format() const {
    return LogFormat{g_utc_timestamp.load(std::memory_order_relaxed),
                     g_source_location.load(std::memory_order_relaxed)};
}

void Logger::SetSink(std::FILE* sink) { g_sink.store(sink, std::memory_order_relaxed); }

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    if (lvl < Level() || lvl == LogLevel::None) return;

    std::FILE* out = g_sink.load(std::memory_order_relaxed);
    if (!out) out = stderr;
    const LogFormat format = Format();

    std::lock_guard<std::mutex> lk(ConsoleMutex());
    if (out == stderr) ClearProgressLine();

    if (format.utc_timestamp) WriteTimestamp(out);
    std::fprintf(out, "%s ", LevelTag(lvl));
    const auto name = FileName(file);
    if (format.source_location && !name.empty() && line > 0) {
        std::fprintf(out, "%.*s:%d: ", static_cast<int>(name.size()), name.data(), line);
    }
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace xfer
