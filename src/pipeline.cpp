#include "matchfeat/pipeline.hpp"
#include "matchfeat/table.hpp"
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace matchfeat {

namespace {

using StepFn = std::function<FeatureResult(const RowTable&, const GroupedSeries&, spdlog::logger&)>;

struct Runnable {
    PipelineStep step;
    StepFn run;
};

// Stable topological order: repeatedly takes the first step whose inputs are
// either not produced by any step or produced by a step already placed. Steps
// left in a cycle keep their declaration order; validation reports them.
std::vector<Runnable> order_by_dependencies(std::vector<Runnable> steps) {
    std::unordered_map<std::string, std::size_t> producer;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        for (auto& column : steps[i].step.produces_columns) producer.try_emplace(column, i);
    }

    std::vector<bool> placed(steps.size(), false);
    auto ready = [&](std::size_t i) {
        return std::ranges::all_of(steps[i].step.requires_columns, [&](const std::string& c) {
            auto it = producer.find(c);
            return it == producer.end() || it->second == i || placed[it->second];
        });
    };

    std::vector<std::size_t> order;
    while (order.size() < steps.size()) {
        std::size_t next = steps.size();
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (!placed[i] && ready(i)) {
                next = i;
                break;
            }
        }
        if (next == steps.size()) {
            for (std::size_t i = 0; i < steps.size(); ++i) {
                if (!placed[i]) order.push_back(i);
            }
            break;
        }
        placed[next] = true;
        order.push_back(next);
    }

    std::vector<Runnable> ordered;
    ordered.reserve(steps.size());
    for (auto i : order) ordered.push_back(std::move(steps[i]));
    return ordered;
}

std::vector<Runnable> build_steps(const PipelineConfig& config) {
    std::vector<Runnable> steps;

    auto add = [&](std::string name, std::vector<std::string> needs,
                   std::vector<std::string> makes, StepFn fn) {
        steps.push_back({
            .step = {.name = std::move(name),
                     .requires_columns = std::move(needs),
                     .produces_columns = std::move(makes)},
            .run = std::move(fn),
        });
    };

    // -- Row-level derivations --

    for (auto& opt : config.rates) {
        add("rate", {opt.numerator, opt.denominator}, {rate_column_name(opt)},
            [opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return rate(t, opt, log);
            });
    }
    for (auto& opt : config.interactions) {
        add("interaction", {opt.left, opt.right}, {interaction_column_name(opt)},
            [opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return interaction(t, opt, log);
            });
    }
    for (auto& opt : config.polynomials) {
        add("polynomial", {opt.column}, polynomial_column_names(opt),
            [opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return polynomial(t, opt, log);
            });
    }
    if (auto& opt = config.pythagorean) {
        std::vector<std::string> needs{opt->goals_for, opt->goals_against, opt->games};
        std::vector<std::string> makes{"pythagorean_win_pct", "pythagorean_wins"};
        if (!opt->wins.empty()) {
            needs.push_back(opt->wins);
            makes.push_back("luck_factor");
        }
        add("pythagorean", std::move(needs), std::move(makes),
            [o = *opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return pythagorean(t, o, log);
            });
    }
    if (auto& opt = config.strength_index) {
        add("strength_index", {opt->wins, opt->losses, opt->goal_diff},
            {"win_rate", "team_strength_index"},
            [o = *opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return team_strength_index(t, o, log);
            });
    }

    // -- Per-group passes --

    for (auto& opt : config.rolling) {
        std::vector<std::string> makes{rolling_column_name(opt)};
        if (opt.flag_partial) makes.push_back(rolling_column_name(opt) + "_partial");
        add("rolling", {opt.column}, std::move(makes),
            [opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return rolling(t, s, opt, log);
            });
    }
    for (auto& opt : config.ewma) {
        add("ewma", {opt.column}, {ewma_column_name(opt)},
            [opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return ewma(t, s, opt, log);
            });
    }
    for (auto& opt : config.lags) {
        add("lag", {opt.column}, lag_column_names(opt),
            [opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return lag(t, s, opt, log);
            });
    }
    for (auto& opt : config.cumulative) {
        add("cumulative", {opt.column}, {cumulative_column_name(opt)},
            [opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return cumulative(t, s, opt, log);
            });
    }
    for (auto& opt : config.ranks) {
        add("rank", {opt.column}, {rank_column_name(opt)},
            [opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return rank_within_group(t, s, opt, log);
            });
    }
    if (auto& opt = config.momentum) {
        add("momentum", {opt->result_column}, {opt->output_name},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return momentum(t, s, o, log);
            });
    }
    if (auto& opt = config.streaks) {
        add("streaks", {opt->result_column},
            {"streak_type", "streak_length", "is_win_streak", "is_loss_streak"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return detect_streaks(t, s, o, log);
            });
    }
    if (auto& opt = config.rest_days) {
        std::vector<std::string> needs;
        if (config.grouping.timestamp_column) needs.push_back(*config.grouping.timestamp_column);
        add("rest_days", std::move(needs), {"rest_days", "is_back_to_back"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return rest_days(t, s, o, log);
            });
    }

    // -- Season-level aggregates --

    if (auto& opt = config.consistency) {
        add("consistency", {opt->score_column},
            {"score_mean", "score_std_dev", "score_cv", "consistency_score"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return consistency(t, s, o, log);
            });
    }
    if (auto& opt = config.clutch) {
        add("clutch", {opt->goal_diff_column, opt->result_column}, {"clutch_factor"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return clutch_factor(t, s, o, log);
            });
    }
    if (auto& opt = config.strength_of_schedule) {
        add("strength_of_schedule", {opt->opponent_wins_column}, {"strength_of_schedule"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return strength_of_schedule(t, s, o, log);
            });
    }
    if (auto& opt = config.head_to_head) {
        add("head_to_head", {opt->team_column, opt->opponent_column, opt->result_column},
            {"h2h_win_rate"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return head_to_head(t, s, o, log);
            });
    }
    if (auto& opt = config.conference) {
        std::vector<std::string> needs{opt->conference_column, opt->win_pct_column};
        std::vector<std::string> makes{"conference_strength"};
        if (!opt->division_column.empty()) {
            needs.push_back(opt->division_column);
            makes.push_back("division_strength");
        }
        makes.push_back("adjusted_win_pct");
        add("conference", std::move(needs), std::move(makes),
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return conference_adjustments(t, s, o, log);
            });
    }
    if (auto& opt = config.home_away) {
        add("home_away", {opt->location_column, opt->result_column},
            {"home_win_rate", "away_win_rate", "home_away_diff"},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return home_away_splits(t, s, o, log);
            });
    }
    if (auto& opt = config.enhanced_strength) {
        add("enhanced_strength", {opt->goals_for, opt->goals_against, opt->games, opt->wins},
            {"enhanced_strength_index"},
            [o = *opt](const RowTable& t, const GroupedSeries&, spdlog::logger& log) {
                return enhanced_strength_index(t, o, log);
            });
    }
    if (auto& opt = config.time_decay) {
        std::vector<std::string> needs;
        if (config.grouping.timestamp_column) needs.push_back(*config.grouping.timestamp_column);
        add("time_decay", std::move(needs), {opt->output_name},
            [o = *opt](const RowTable& t, const GroupedSeries& s, spdlog::logger& log) {
                return time_decay_weights(t, s, o, log);
            });
    }

    return order_by_dependencies(std::move(steps));
}

std::unexpected<FeatureError> step_failed(const std::string& step, const FeatureError& error) {
    return std::unexpected(FeatureError{error.kind, step + ": " + error.message});
}

} // namespace

std::vector<PipelineStep> plan_steps(const PipelineConfig& config) {
    std::vector<PipelineStep> plan;
    for (auto& r : build_steps(config)) plan.push_back(std::move(r.step));
    return plan;
}

std::expected<void, FeatureError> validate_pipeline(
    const std::vector<std::string>& input_columns, const PipelineConfig& config) {

    std::unordered_set<std::string> available(input_columns.begin(), input_columns.end());

    auto require = [&](const std::string& step, const std::string& column)
        -> std::expected<void, FeatureError> {
        if (!available.contains(column)) {
            return std::unexpected(FeatureError{
                ErrorKind::UnknownColumn,
                step + ": unknown column '" + column + "'"});
        }
        return {};
    };

    if (config.grouping.group_column) {
        if (auto ok = require("grouping", *config.grouping.group_column); !ok) return ok;
    }

    for (auto& step : plan_steps(config)) {
        for (auto& column : step.requires_columns) {
            if (auto ok = require(step.name, column); !ok) return ok;
        }
        for (auto& column : step.produces_columns) {
            if (!available.insert(column).second) {
                return std::unexpected(FeatureError{
                    ErrorKind::DuplicateColumn,
                    step.name + ": column '" + column + "' already exists"});
            }
        }
    }

    if (config.time_series_split) {
        if (auto ok = require("time_series_split", config.time_series_split->timestamp_column); !ok) {
            return ok;
        }
    }
    if (config.stratified_split) {
        if (auto ok = require("stratified_split", config.stratified_split->target_column); !ok) {
            return ok;
        }
    }
    return {};
}

std::expected<PipelineResult, FeatureError> run_pipeline(
    RowTable table, const PipelineConfig& config, spdlog::logger& log) {

    if (auto ok = validate_pipeline(table.columns, config); !ok) {
        return std::unexpected(ok.error());
    }

    auto series = group_series(table, config.grouping, log);
    if (!series) return step_failed("grouping", series.error());

    PipelineResult result;
    for (auto& [step, run] : build_steps(config)) {
        auto features = run(table, *series, log);
        if (!features) return step_failed(step.name, features.error());
        if (auto ok = apply_features(table, std::move(*features)); !ok) {
            return step_failed(step.name, ok.error());
        }
        result.added_columns.insert(result.added_columns.end(),
                                    step.produces_columns.begin(), step.produces_columns.end());
    }

    log.info("Total features: {}", table.columns.size());
    log.info("Sample count: {}", table.size());

    if (config.time_series_split) {
        auto folds = time_series_splits(table, *config.time_series_split, log);
        if (!folds) return step_failed("time_series_split", folds.error());
        result.folds = std::move(*folds);
    }
    if (config.stratified_split) {
        auto split = stratified_split(table, *config.stratified_split, log);
        if (!split) return step_failed("stratified_split", split.error());
        result.split = std::move(*split);
    }

    result.table = std::move(table);
    result.series = std::move(*series);
    return result;
}

std::vector<FeatureSummary> summarize_features(const RowTable& table,
                                               const std::vector<std::string>& columns) {
    std::vector<FeatureSummary> out;
    out.reserve(columns.size());
    for (auto& name : columns) {
        FeatureSummary s{.name = name};
        double sum = 0.0;
        for (auto& row : table.rows) {
            auto v = row.number(name);
            if (!v) continue;
            ++s.count;
            sum += *v;
            s.min = s.min ? std::min(*s.min, *v) : *v;
            s.max = s.max ? std::max(*s.max, *v) : *v;
        }
        if (s.count > 0) s.mean = sum / static_cast<double>(s.count);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace matchfeat
