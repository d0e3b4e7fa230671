#pragma once
#include "secret_mask.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ambassador {

/// Wraps another sink and masks every registered secret in the formatted
/// payload before forwarding the record. Pattern and formatter changes are
/// forwarded to the wrapped sink, which does the actual formatting.
template <typename Mutex>
class RedactingSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit RedactingSink(spdlog::sink_ptr inner) : inner_(std::move(inner)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string_view raw(msg.payload.data(), msg.payload.size());
        std::string masked = SecretRegistry::instance().redact(raw);
        spdlog::details::log_msg copy(msg);
        copy.payload = spdlog::string_view_t(masked.data(), masked.size());
        inner_->log(copy);
    }

    void flush_() override { inner_->flush(); }

    void set_pattern_(const std::string& pattern) override { inner_->set_pattern(pattern); }

    void set_formatter_(std::unique_ptr<spdlog::formatter> formatter) override {
        inner_->set_formatter(std::move(formatter));
    }

private:
    spdlog::sink_ptr inner_;
};

using RedactingSinkMt = RedactingSink<std::mutex>;

struct LoggingOptions {
    std::string level = "info";
    std::optional<std::string> file;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/// Throws ConfigError for an unknown level name.
[[nodiscard]] spdlog::level::level_enum parse_log_level(const std::string& name);

/// Build a logger whose sinks are all wrapped in a RedactingSink.
[[nodiscard]] std::shared_ptr<spdlog::logger> make_redacting_logger(
    const std::string& name, const std::vector<spdlog::sink_ptr>& sinks);

/// Install the default logger: stderr (never stdout, which carries the
/// protocol stream) plus an optional file, both redacting.
void init_logging(const LoggingOptions& opts);

} // namespace ambassador
