#pragma once
// RPC Protocol: JSON-RPC 2.0 envelopes and error codes
//
// One request per line on stdin, one response per line on stdout.

#include "../types.hpp"
#include <string>

namespace colloquy::rpc {

// Replace invalid UTF-8 sequences with U+FFFD
inline std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len > 0 && i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Colloquy-specific
    constexpr int UNKNOWN_NPC = -32001;
    constexpr int TURN_FAILED = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be an object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

} // namespace colloquy::rpc
