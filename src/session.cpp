#include "ranger/session.hpp"

namespace ranger {

std::string session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::Closed:        return "closed";
        default:                          return "unknown";
    }
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

void Session::begin(std::string protocol_version, std::optional<Implementation> client_info,
                    ClientCapabilities client_caps) {
    std::lock_guard<std::mutex> lock(mutex_);
    protocol_version_ = std::move(protocol_version);
    client_info_ = std::move(client_info);
    client_caps_ = std::move(client_caps);
    state_ = SessionState::Initializing;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

} // namespace ranger
