#include "ambassador/frame_reader.hpp"
#include "ambassador/error.hpp"
#include <spdlog/spdlog.h>

namespace ambassador {

namespace {

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

FrameReader::FrameReader() : FrameReader(Limits{}) {}

FrameReader::FrameReader(Limits limits) : limits_(limits) {}

std::vector<std::string> FrameReader::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    buffer_.append(chunk.data(), chunk.size());

    size_t pos = 0;
    while (true) {
        size_t nl = buffer_.find('\n', pos);
        if (nl == std::string::npos) break;

        std::string_view segment(buffer_.data() + pos, nl - pos);
        pos = nl + 1;

        if (segment.size() > limits_.max_message_bytes) {
            ++dropped_;
            spdlog::error("Message exceeds max size ({} bytes > {} bytes), ignoring",
                          segment.size(), limits_.max_message_bytes);
            continue;
        }

        std::string_view line = trim(segment);
        if (line.empty()) continue;
        lines.emplace_back(line);
    }

    if (pos > 0) {
        buffer_.erase(0, pos);
    }

    if (buffer_.size() > limits_.max_buffer_bytes) {
        size_t held = buffer_.size();
        buffer_.clear();
        buffer_.shrink_to_fit();
        throw FrameOverflowError("stdin buffer exceeded max size (" + std::to_string(held)
                                 + " bytes > " + std::to_string(limits_.max_buffer_bytes) + " bytes)");
    }
    return lines;
}

size_t FrameReader::finish() {
    size_t dropped = trim(buffer_).size();
    buffer_.clear();
    return dropped;
}

} // namespace ambassador
