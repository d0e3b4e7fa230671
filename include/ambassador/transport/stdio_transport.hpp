#pragma once
#include "transport.hpp"
#include "../error.hpp"
#include "../frame_reader.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace ambassador {

struct StdioOptions {
    FrameReader::Limits limits;
    /// Invoked when the input buffer ceiling is exceeded. The default logs
    /// and terminates the process immediately with exit code 1.
    std::function<void(const FrameOverflowError&)> on_overflow;
};

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Uses the calling thread for reading and a background writer thread fed by
/// a queue, so each frame reaches the output in one piece.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(StdioOptions opts);

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are closed on destruction.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, StdioOptions opts);

    ~StdioTransport() override;

    void start(LineCallback on_line, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcResponse& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// True once the input buffer ceiling was hit.
    [[nodiscard]] bool overflowed() const { return overflowed_; }

private:
    void read_loop(const LineCallback& on_line, const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    StdioOptions opts_;
    FrameReader reader_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> overflowed_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace ambassador
