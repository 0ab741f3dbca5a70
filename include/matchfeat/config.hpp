#pragma once

#include "matchfeat/pipeline.hpp"
#include "matchfeat/types.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace matchfeat {

std::expected<PipelineConfig, FeatureError> parse_config(const nlohmann::json& j);

std::expected<PipelineConfig, FeatureError> load_config(const std::filesystem::path& path);

} // namespace matchfeat
