#include <colloquy/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace colloquy {
namespace log {

namespace {

std::atomic<bool> verbose_mode{false};
std::atomic<bool> quiet_mode{false};
std::mutex write_mutex;

const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "";
        case Level::Info: return "";
        case Level::Warn: return "warning: ";
        case Level::Error: return "error: ";
    }
    return "";
}

} // namespace

void set_verbose(bool enabled) { verbose_mode = enabled; }
void set_quiet(bool enabled) { quiet_mode = enabled; }

void write(Level level, const char* component, const char* fmt, ...) {
    if (quiet_mode) return;
    if (level == Level::Debug && !verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    // One lock per line so concurrent stages don't interleave
    std::lock_guard<std::mutex> lock(write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, level_tag(level));

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace log
} // namespace colloquy
