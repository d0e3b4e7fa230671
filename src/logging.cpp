#include "ambassador/logging.hpp"
#include "ambassador/error.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ambassador {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Invalid log level: " + name);
}

std::shared_ptr<spdlog::logger> make_redacting_logger(
    const std::string& name, const std::vector<spdlog::sink_ptr>& sinks) {
    std::vector<spdlog::sink_ptr> wrapped;
    wrapped.reserve(sinks.size());
    for (const auto& sink : sinks) {
        wrapped.push_back(std::make_shared<RedactingSinkMt>(sink));
    }
    return std::make_shared<spdlog::logger>(name, wrapped.begin(), wrapped.end());
}

void init_logging(const LoggingOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (opts.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*opts.file));
    }

    auto logger = make_redacting_logger("ambassador", sinks);
    logger->set_level(parse_log_level(opts.level));
    logger->set_pattern(opts.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace ambassador
