#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace ranger {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Callback for frames that could not be decoded and for I/O failures
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until the peer goes away or shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a message to the remote peer.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Graceful shutdown; safe to call from any thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace ranger
