#pragma once
// Log: component-tagged diagnostics on stderr
//
//   [09:30:12.345][coordinator] Step 1: retrieve memory and affinity
//
// Debug lines only appear in verbose mode. Quiet mode silences
// everything (used by the test runner).

namespace colloquy {
namespace log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

void set_verbose(bool enabled);
void set_quiet(bool enabled);

// printf-style
void write(Level level, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace log
} // namespace colloquy

#define COLLOQUY_LOG_DEBUG(component, ...) \
    ::colloquy::log::write(::colloquy::log::Level::Debug, component, __VA_ARGS__)
#define COLLOQUY_LOG_INFO(component, ...) \
    ::colloquy::log::write(::colloquy::log::Level::Info, component, __VA_ARGS__)
#define COLLOQUY_LOG_WARN(component, ...) \
    ::colloquy::log::write(::colloquy::log::Level::Warn, component, __VA_ARGS__)
#define COLLOQUY_LOG_ERROR(component, ...) \
    ::colloquy::log::write(::colloquy::log::Level::Error, component, __VA_ARGS__)
