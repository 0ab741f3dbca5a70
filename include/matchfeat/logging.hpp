#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace matchfeat {

// Logger that discards everything; the default for engine functions.
spdlog::logger& null_logger();

std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name = "matchfeat",
    spdlog::level::level_enum level = spdlog::level::info);

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

} // namespace matchfeat
