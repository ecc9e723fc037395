#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace ranger {

/// Newline-delimited JSON-RPC over a pair of file descriptors.
/// The calling thread reads; a background thread drains the write queue.
class StdioTransport : public ITransport {
public:
    /// Use the process's stdin/stdout.
    /// Throws McpTransportError if the wakeup pipe cannot be created.
    StdioTransport();

    /// Use the given descriptors and close them on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    StdioTransport(int read_fd, int write_fd, bool owns_fds);

    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // set once by the constructor; lets shutdown() interrupt poll()
};

} // namespace ranger
