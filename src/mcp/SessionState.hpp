#pragma once

#include <string>
#include <string_view>

namespace mcpline {

/**
 * @brief Lifecycle of one connected peer
 */
enum class SessionState {
    UNINITIALIZED,  // waiting for initialize
    READY,          // handshake done, tools callable
    SHUTTING_DOWN,  // shutdown acknowledged, transport closing
    CLOSED          // terminal
};

inline std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::UNINITIALIZED: return "UNINITIALIZED";
        case SessionState::READY:         return "READY";
        case SessionState::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case SessionState::CLOSED:        return "CLOSED";
    }
    return "UNKNOWN";
}

/**
 * @brief Mutable state scoped to one session and shared by its tools
 *
 * Only the session thread touches it; dispatch waits for every handler
 * before reading the next request.
 */
struct SessionContext {
    std::string current_namespace = "default";
};

} // namespace mcpline
