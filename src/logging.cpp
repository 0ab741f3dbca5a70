#include "matchfeat/logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace matchfeat {

spdlog::logger& null_logger() {
    static auto logger = std::make_shared<spdlog::logger>(
        "matchfeat-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return *logger;
}

std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name, spdlog::level::level_enum level) {

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info") return spdlog::level::info;
    if (text == "warn" || text == "warning") return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    if (text == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace matchfeat
