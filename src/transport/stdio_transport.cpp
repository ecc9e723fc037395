#include "ranger/transport/stdio_transport.hpp"
#include "ranger/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace ranger {

namespace {

template <typename E>
void report(const ErrorCallback& on_error, const std::string& what) {
    if (!on_error) return;
    on_error(std::make_exception_ptr(E(what)));
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, true) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
    // Created here and never reassigned, so shutdown() may use it from any thread.
    if (::pipe(wakeup_pipe_) < 0) {
        const std::string reason = std::strerror(errno);
        if (owns_fds_) {
            ::close(read_fd_);
            ::close(write_fd_);
        }
        throw McpTransportError("Failed to create wakeup pipe: " + reason);
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start() means there is nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw McpTransportError("Transport already started");
    }

    connected_ = true;
    writer_thread_ = std::thread([this]() { write_loop(); });

    read_loop(on_message, on_error);

    // Let the writer drain whatever the handlers queued, then stop it.
    // running_ changes under the writer's mutex so the wakeup cannot slip
    // between its predicate check and its wait.
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        running_ = false;
    }
    connected_ = false;
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (running_ && !shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report<McpTransportError>(on_error, std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) break;  // shutdown()
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (running_) {
                report<McpTransportError>(on_error, std::string("Read error: ") + std::strerror(errno));
            }
            break;
        }
        if (n == 0) {
            // EOF: a final unterminated line still counts as a frame.
            if (!buffer.empty()) handle_line(std::move(buffer), on_message, on_error);
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            handle_line(std::move(line), on_message, on_error);
        }
        if (pos > 0) buffer.erase(0, pos);
    }
}

void StdioTransport::handle_line(std::string line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) return;

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpParseError&) {
        if (on_error) on_error(std::current_exception());
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });
            if (write_queue_.empty()) break;  // stopped and drained
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                connected_ = false;  // peer closed its end
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    char b = 1;
    // A full pipe already holds a pending wakeup, so EAGAIN is fine.
    ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
    (void)ignored;
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    connected_ = false;
    // The wakeup stays readable, so a reader that has not reached poll()
    // yet still returns at once. start() stops the writer on its way out.
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace ranger
