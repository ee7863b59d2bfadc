#pragma once

#define COLLOQUY_VERSION "1.0.0"
#define COLLOQUY_PROTOCOL_VERSION_MAJOR 1
#define COLLOQUY_PROTOCOL_VERSION_MINOR 0

namespace colloquy {
namespace version {

// Client protocol (major, minor) against ours.
// Major must match; the client may not expect a newer minor than we speak.
inline bool protocol_compatible(int major, int minor) {
    return major == COLLOQUY_PROTOCOL_VERSION_MAJOR &&
           minor <= COLLOQUY_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace colloquy
