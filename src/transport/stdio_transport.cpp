#include "mockmcp/transport/stdio_transport.hpp"
#include "mockmcp/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace mockmcp {

namespace {

void trim_in_place(std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    s.erase(end);
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    s.erase(0, begin);
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
    owns_fds_ = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    // Created up front so shutdown() from another thread never races start().
    if (pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block — exit immediately.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    read_loop(on_message, on_error);

    running_ = false;
    connected_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
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
            break;
        }

        // Wakeup pipe has data → shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLNVAL) {
            if (on_error) {
                on_error(std::make_exception_ptr(McpTransportError("Invalid input descriptor")));
            }
            break;
        }

        // POLLHUP without POLLIN still needs a read() to observe EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    McpTransportError(std::string("Read error: ") + strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            // EOF: an unterminated last line still counts.
            if (!buffer.empty()) {
                process_line(std::move(buffer), on_message, on_error);
                buffer.clear();
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            process_line(std::move(line), on_message, on_error);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::process_line(std::string line, const MessageCallback& on_message,
                                  const ErrorCallback& on_error) {
    trim_in_place(line);
    if (line.empty()) return;

    JsonRpcRequest req;
    try {
        req = Codec::parse(line);
    } catch (const McpParseError&) {
        if (on_error) on_error(std::current_exception());
        return;
    }
    on_message(std::move(req));
}

void StdioTransport::send(const JsonRpcResponse& msg) {
    if (shutdown_requested_.load() && !running_.load()) {
        throw McpTransportError("Transport shut down");
    }
    write_all(Codec::serialize(msg) + '\n');
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::wake_reader() {
    char b = 1;
    // EAGAIN means the pipe is full, so a wakeup is already pending.
    while (::write(wakeup_pipe_[1], &b, 1) < 0 && errno == EINTR) {
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        return; // start() hasn't been called yet (or already shut down).
    }
    connected_ = false;
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mockmcp
