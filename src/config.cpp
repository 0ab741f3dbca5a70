#include "matchfeat/config.hpp"
#include <fstream>
#include <stdexcept>

namespace matchfeat {

namespace {

using nlohmann::json;

std::string req_str(const json& j, const std::string& key) {
    return j.at(key).get<std::string>();
}

std::string safe_str(const json& j, const std::string& key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::optional<std::string> opt_str(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<double> opt_num(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

AggregateScope scope_of(const json& j) {
    auto text = safe_str(j, "scope", "season");
    auto scope = parse_scope(text);
    if (!scope) throw std::invalid_argument("unknown scope '" + text + "'");
    return *scope;
}

// Accepts a single object or an array of objects.
template <typename Options, typename Parse>
std::vector<Options> parse_list(const json& j, const std::string& key, Parse parse) {
    std::vector<Options> out;
    if (!j.contains(key)) return out;
    auto& node = j.at(key);
    if (node.is_array()) {
        for (auto& item : node) out.push_back(parse(item));
    } else {
        out.push_back(parse(node));
    }
    return out;
}

template <typename Options, typename Parse>
std::optional<Options> parse_optional(const json& j, const std::string& key, Parse parse) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return parse(j.at(key));
}

RateOptions parse_rate(const json& j) {
    return {
        .numerator = req_str(j, "numerator"),
        .denominator = req_str(j, "denominator"),
        .output_name = safe_str(j, "output"),
        .zero_denominator = opt_num(j, "zero_value"),
    };
}

InteractionOptions parse_interaction(const json& j) {
    return {
        .left = req_str(j, "left"),
        .right = req_str(j, "right"),
        .output_name = safe_str(j, "output"),
    };
}

PolynomialOptions parse_polynomial(const json& j) {
    return {.column = req_str(j, "column"), .degree = j.value("degree", 2)};
}

RollingOptions parse_rolling(const json& j) {
    auto stat_text = j.value("stat", std::string("mean"));
    auto stat = parse_rolling_stat(stat_text);
    if (!stat) throw std::invalid_argument("unknown rolling statistic '" + stat_text + "'");
    return {
        .column = req_str(j, "column"),
        .window = j.value("window", 10),
        .stat = *stat,
        .output_name = safe_str(j, "output"),
        .flag_partial = j.value("flag_partial", false),
    };
}

EwmaOptions parse_ewma(const json& j) {
    return {
        .column = req_str(j, "column"),
        .alpha = opt_num(j, "alpha"),
        .span = opt_num(j, "span"),
        .output_name = safe_str(j, "output"),
    };
}

LagOptions parse_lag(const json& j) {
    return {.column = req_str(j, "column"), .periods = j.at("periods").get<std::vector<int>>()};
}

CumulativeOptions parse_cumulative(const json& j) {
    auto stat_text = j.value("stat", std::string("sum"));
    auto stat = parse_rolling_stat(stat_text);
    if (!stat) throw std::invalid_argument("unknown cumulative statistic '" + stat_text + "'");
    return {
        .column = req_str(j, "column"),
        .stat = *stat,
        .output_name = safe_str(j, "output"),
    };
}

RankOptions parse_rank(const json& j) {
    return {
        .column = req_str(j, "column"),
        .ascending = j.value("ascending", false),
        .scope = scope_of(j),
        .output_name = safe_str(j, "output"),
    };
}

MomentumOptions parse_momentum(const json& j) {
    return {
        .result_column = req_str(j, "result_column"),
        .window = j.value("window", 10),
        .output_name = safe_str(j, "output", "momentum_score"),
    };
}

StreakOptions parse_streaks(const json& j) {
    return {.result_column = req_str(j, "result_column")};
}

RestDaysOptions parse_rest_days(const json& j) {
    return {
        .first_game_days = j.value("first_game_days", 3),
        .back_to_back_max_days = j.value("back_to_back_max_days", 1),
    };
}

TimeDecayOptions parse_time_decay(const json& j) {
    return {
        .decay_rate = j.value("decay_rate", 0.05),
        .output_name = safe_str(j, "output", "time_weight"),
    };
}

PythagoreanOptions parse_pythagorean(const json& j) {
    return {
        .goals_for = safe_str(j, "goals_for", "GF"),
        .goals_against = safe_str(j, "goals_against", "GA"),
        .games = safe_str(j, "games", "GP"),
        .wins = safe_str(j, "wins", "W"),
    };
}

StrengthIndexOptions parse_strength_index(const json& j) {
    return {
        .wins = safe_str(j, "wins", "W"),
        .losses = safe_str(j, "losses", "L"),
        .goal_diff = safe_str(j, "goal_diff", "DIFF"),
    };
}

EnhancedStrengthOptions parse_enhanced(const json& j) {
    return {
        .goals_for = safe_str(j, "goals_for", "GF"),
        .goals_against = safe_str(j, "goals_against", "GA"),
        .games = safe_str(j, "games", "GP"),
        .wins = safe_str(j, "wins", "W"),
    };
}

ConsistencyOptions parse_consistency(const json& j) {
    return {.score_column = req_str(j, "score_column"), .scope = scope_of(j)};
}

ClutchOptions parse_clutch(const json& j) {
    return {
        .goal_diff_column = req_str(j, "goal_diff_column"),
        .result_column = req_str(j, "result_column"),
        .close_margin = j.value("close_margin", 1.0),
        .scope = scope_of(j),
    };
}

ScheduleOptions parse_schedule(const json& j) {
    return {.opponent_wins_column = req_str(j, "opponent_wins_column"), .scope = scope_of(j)};
}

HeadToHeadOptions parse_h2h(const json& j) {
    return {
        .team_column = req_str(j, "team_column"),
        .opponent_column = req_str(j, "opponent_column"),
        .result_column = req_str(j, "result_column"),
        .scope = scope_of(j),
    };
}

ConferenceOptions parse_conference(const json& j) {
    return {
        .conference_column = req_str(j, "conference_column"),
        .division_column = safe_str(j, "division_column"),
        .win_pct_column = req_str(j, "win_pct_column"),
        .scope = scope_of(j),
    };
}

HomeAwayOptions parse_home_away(const json& j) {
    return {
        .location_column = req_str(j, "location_column"),
        .result_column = req_str(j, "result_column"),
        .scope = scope_of(j),
    };
}

TimeSeriesSplitOptions parse_ts_split(const json& j) {
    return {
        .timestamp_column = safe_str(j, "timestamp_column", "date"),
        .n_splits = j.value("n_splits", 5),
        .test_fraction = j.value("test_fraction", 0.2),
    };
}

StratifiedSplitOptions parse_stratified(const json& j) {
    return {
        .target_column = req_str(j, "target_column"),
        .test_fraction = j.value("test_fraction", 0.2),
        .seed = j.value("seed", std::uint32_t{42}),
    };
}

} // namespace

std::expected<PipelineConfig, FeatureError> parse_config(const json& j) {
    if (!j.is_object()) {
        return std::unexpected(FeatureError{ErrorKind::InvalidConfig, "config must be a JSON object"});
    }

    try {
        PipelineConfig config;
        config.grouping = {
            .group_column = opt_str(j, "group_column"),
            .timestamp_column = opt_str(j, "timestamp_column"),
            .sequence_column = opt_str(j, "sequence_column"),
        };

        config.rates = parse_list<RateOptions>(j, "rates", parse_rate);
        config.interactions = parse_list<InteractionOptions>(j, "interactions", parse_interaction);
        config.polynomials = parse_list<PolynomialOptions>(j, "polynomials", parse_polynomial);
        config.pythagorean = parse_optional<PythagoreanOptions>(j, "pythagorean", parse_pythagorean);
        config.strength_index =
            parse_optional<StrengthIndexOptions>(j, "strength_index", parse_strength_index);

        config.rolling = parse_list<RollingOptions>(j, "rolling", parse_rolling);
        config.ewma = parse_list<EwmaOptions>(j, "ewma", parse_ewma);
        config.lags = parse_list<LagOptions>(j, "lags", parse_lag);
        config.cumulative = parse_list<CumulativeOptions>(j, "cumulative", parse_cumulative);
        config.ranks = parse_list<RankOptions>(j, "rank", parse_rank);
        config.momentum = parse_optional<MomentumOptions>(j, "momentum", parse_momentum);
        config.streaks = parse_optional<StreakOptions>(j, "streaks", parse_streaks);
        config.rest_days = parse_optional<RestDaysOptions>(j, "rest_days", parse_rest_days);

        config.consistency = parse_optional<ConsistencyOptions>(j, "consistency", parse_consistency);
        config.clutch = parse_optional<ClutchOptions>(j, "clutch", parse_clutch);
        config.strength_of_schedule =
            parse_optional<ScheduleOptions>(j, "strength_of_schedule", parse_schedule);
        config.head_to_head = parse_optional<HeadToHeadOptions>(j, "head_to_head", parse_h2h);
        config.conference = parse_optional<ConferenceOptions>(j, "conference", parse_conference);
        config.home_away = parse_optional<HomeAwayOptions>(j, "home_away", parse_home_away);
        config.enhanced_strength =
            parse_optional<EnhancedStrengthOptions>(j, "enhanced_strength", parse_enhanced);
        config.time_decay = parse_optional<TimeDecayOptions>(j, "time_decay", parse_time_decay);

        config.time_series_split =
            parse_optional<TimeSeriesSplitOptions>(j, "time_series_split", parse_ts_split);
        config.stratified_split =
            parse_optional<StratifiedSplitOptions>(j, "stratified_split", parse_stratified);

        return config;
    } catch (const json::exception& e) {
        return std::unexpected(FeatureError{ErrorKind::InvalidConfig, e.what()});
    } catch (const std::invalid_argument& e) {
        return std::unexpected(FeatureError{ErrorKind::InvalidConfig, e.what()});
    }
}

std::expected<PipelineConfig, FeatureError> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(FeatureError{ErrorKind::Io, "cannot open " + path.string()});
    }

    try {
        return parse_config(json::parse(file));
    } catch (const json::parse_error& e) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidConfig, path.string() + ": " + e.what()});
    }
}

} // namespace matchfeat
