#include "matchfeat/config.hpp"
#include "matchfeat/csv.hpp"
#include "matchfeat/display.hpp"
#include "matchfeat/logging.hpp"
#include "matchfeat/pipeline.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace {

struct CliArgs {
    std::string input;
    std::string config;
    std::string output;
    std::string folds_out;
    std::optional<std::string> group;
    std::optional<std::string> timestamp;
    matchfeat::OutputFormat format = matchfeat::OutputFormat::Table;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

void print_usage() {
    std::cerr << R"(Usage: matchfeat <input.csv> <config.json> [options]
  --output <file.csv>       Write the enriched table
  --folds-out <file.json>   Write cross-validation folds as JSON
  --format <table|csv>      Summary format (default: table)
  --group <column>          Entity column (overrides config group_column)
  --timestamp <column>      Time column (overrides config timestamp_column)
  --log-level <level>       trace|debug|info|warn|error|off
                            (or set MATCHFEAT_LOG_LEVEL env var)
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 3) return std::nullopt;

    CliArgs args;
    args.input = argv[1];
    args.config = argv[2];

    std::string level_text;
    if (auto* env = std::getenv("MATCHFEAT_LOG_LEVEL")) {
        level_text = env;
    }

    for (int i = 3; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        if (flag == "--output") args.output = val;
        else if (flag == "--folds-out") args.folds_out = val;
        else if (flag == "--group") args.group = val;
        else if (flag == "--timestamp") args.timestamp = val;
        else if (flag == "--log-level") level_text = val;
        else if (flag == "--format") {
            if (val != "table" && val != "csv") {
                std::cerr << "Unknown format: " << val << "\n";
                return std::nullopt;
            }
            args.format = (val == "csv") ? matchfeat::OutputFormat::Csv
                                         : matchfeat::OutputFormat::Table;
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    if (!level_text.empty()) {
        auto level = matchfeat::parse_log_level(level_text);
        if (!level) {
            std::cerr << "Unknown log level: " << level_text << "\n";
            return std::nullopt;
        }
        args.log_level = *level;
    }

    return args;
}

bool write_folds(const std::string& path, const matchfeat::PipelineResult& result) {
    nlohmann::json j;
    j["folds"] = result.folds;
    if (result.split) j["stratified_split"] = *result.split;

    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << j.dump(2) << "\n";
    return static_cast<bool>(file);
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    auto log = matchfeat::make_logger("matchfeat", args->log_level);

    auto table = matchfeat::read_csv(args->input);
    if (!table) {
        log->error("Error reading {}: {}", args->input, table.error().message);
        return 1;
    }
    log->info("Loaded {} rows, {} columns from {}",
              table->size(), table->columns.size(), args->input);

    auto config = matchfeat::load_config(args->config);
    if (!config) {
        log->error("Error loading config: {}", config.error().message);
        return 1;
    }
    if (args->group) config->grouping.group_column = *args->group;
    if (args->timestamp) config->grouping.timestamp_column = *args->timestamp;

    auto result = matchfeat::run_pipeline(std::move(*table), *config, *log);
    if (!result) {
        log->error("Pipeline failed ({}): {}",
                   matchfeat::to_string(result.error().kind), result.error().message);
        return 1;
    }

    if (!args->output.empty()) {
        if (auto ok = matchfeat::write_csv(args->output, result->table); !ok) {
            log->error("Error writing output: {}", ok.error().message);
            return 1;
        }
        log->info("Wrote {} rows to {}", result->table.size(), args->output);
    }

    if (!args->folds_out.empty()) {
        if (!write_folds(args->folds_out, *result)) {
            log->error("Error writing folds to {}", args->folds_out);
            return 1;
        }
        log->info("Wrote {} folds to {}", result->folds.size(), args->folds_out);
    }

    matchfeat::display_grouping(result->series, args->format);
    matchfeat::display_features(
        matchfeat::summarize_features(result->table, result->added_columns), args->format);

    if (config->time_series_split) {
        matchfeat::display_folds(result->folds, result->table,
                                 config->time_series_split->timestamp_column, args->format);
    }
    if (config->stratified_split && result->split) {
        matchfeat::display_split(*result->split, result->table,
                                 config->stratified_split->target_column, args->format);
    }

    return 0;
}
