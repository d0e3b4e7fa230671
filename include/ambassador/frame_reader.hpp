#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ambassador {

/// Reassembles newline-delimited frames from arbitrarily chunked input.
///
/// Every complete line is trimmed and, if non-empty, emitted. The trailing
/// segment without a newline is kept for the next chunk. Two ceilings apply:
///  - unconsumed buffer larger than max_buffer_bytes: feed() throws
///    FrameOverflowError and the reader must not be used further;
///  - a single line longer than max_message_bytes: the line is dropped and
///    counted in dropped_messages().
class FrameReader {
public:
    struct Limits {
        size_t max_buffer_bytes = 10 * 1024 * 1024;
        size_t max_message_bytes = 1 * 1024 * 1024;
    };

    FrameReader();
    explicit FrameReader(Limits limits);

    /// Append a chunk and return the lines it completed, in order.
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// Bytes held for an incomplete trailing line.
    [[nodiscard]] size_t buffered() const { return buffer_.size(); }

    /// Discard any incomplete trailing line (end of input). Returns the
    /// number of bytes dropped.
    size_t finish();

    [[nodiscard]] size_t dropped_messages() const { return dropped_; }
    [[nodiscard]] const Limits& limits() const { return limits_; }

private:
    Limits limits_;
    std::string buffer_;
    size_t dropped_{0};
};

} // namespace ambassador
