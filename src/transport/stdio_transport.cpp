#include "ambassador/transport/stdio_transport.hpp"
#include "ambassador/codec.hpp"
#include "ambassador/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace ambassador {

namespace {

void terminate_on_overflow(const FrameOverflowError& e) {
    spdlog::critical("{}, terminating", e.what());
    spdlog::default_logger()->flush();
    std::_Exit(EXIT_FAILURE);
}

} // anonymous namespace

StdioTransport::StdioTransport() : StdioTransport(StdioOptions{}) {}

StdioTransport::StdioTransport(StdioOptions opts)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false)
    , opts_(std::move(opts)), reader_(opts_.limits) {
    if (pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, StdioOptions{}) {}

StdioTransport::StdioTransport(int read_fd, int write_fd, StdioOptions opts)
    : StdioTransport(std::move(opts)) {
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    owns_fds_ = true;
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(LineCallback on_line, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_line, on_error);
    connected_ = false;
}

void StdioTransport::read_loop(const LineCallback& on_line, const ErrorCallback& on_error) {
    char chunk[4096];

    while (running_) {
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

        // Wakeup pipe has data: shutdown() was called
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            size_t partial = reader_.finish();
            if (partial > 0) {
                spdlog::warn("stdin closed with an incomplete message ({} bytes), discarding", partial);
            }
            spdlog::info("stdin closed");
            break;
        }

        std::vector<std::string> lines;
        try {
            lines = reader_.feed(std::string_view(chunk, static_cast<size_t>(n)));
        } catch (const FrameOverflowError& e) {
            overflowed_ = true;
            if (opts_.on_overflow) {
                opts_.on_overflow(e);
            } else {
                terminate_on_overflow(e);
            }
            break;
        }

        for (auto& line : lines) {
            on_line(std::move(line));
        }
    }
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || shutdown_requested_;
            });

            if (write_queue_.empty()) break;  // shutdown requested and drained
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
                spdlog::error("stdout write failed: {}", strerror(errno));
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcResponse& msg) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // Non-blocking; a full pipe already guarantees a wakeup.
        (void)!::write(wakeup_pipe_[1], &b, 1);
    }
}

void StdioTransport::shutdown() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        shutdown_requested_ = true;
    }
    write_cv_.notify_all();
    running_ = false;
    connected_ = false;
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace ambassador
