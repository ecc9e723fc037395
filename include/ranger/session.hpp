#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace ranger {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

std::string session_state_to_string(SessionState s);

/// Negotiated state of one client connection.
class Session {
public:
    Session() = default;

    SessionState state() const;
    void set_state(SessionState s);

    /// Record the outcome of initialize and move to Initializing.
    void begin(std::string protocol_version, std::optional<Implementation> client_info,
               ClientCapabilities client_caps);

    std::string protocol_version() const;
    std::optional<Implementation> client_info() const;
    ClientCapabilities client_capabilities() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocol_version_;
    std::optional<Implementation> client_info_;
    ClientCapabilities client_caps_;
};

} // namespace ranger
