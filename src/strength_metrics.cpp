#include "matchfeat/strength_metrics.hpp"
#include "matchfeat/table.hpp"
#include "matchfeat/temporal_grouper.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace matchfeat {

namespace {

constexpr double neutral_rate = 0.5;

// Feeds rows to `add` and asks `emit` for each row's value, in the order the
// scope allows: the whole season first, or interleaved with the scan. Rows
// sharing an order key form one bucket; a bucket is added as a whole, so
// both sides of a game see the same history.
template <typename Add, typename Emit>
void scan_scoped(const std::vector<std::size_t>& rows, const std::vector<double>& keys,
                 AggregateScope scope, Add&& add, Emit&& emit) {
    if (scope == AggregateScope::Season) {
        for (auto row : rows) add(row);
        for (auto row : rows) emit(row);
        return;
    }

    for (std::size_t begin = 0; begin < rows.size();) {
        std::size_t end = begin + 1;
        while (end < rows.size() && keys[end] == keys[begin]) ++end;

        if (scope == AggregateScope::AsOfRow) {
            for (std::size_t i = begin; i < end; ++i) add(rows[i]);
            for (std::size_t i = begin; i < end; ++i) emit(rows[i]);
        } else {
            for (std::size_t i = begin; i < end; ++i) emit(rows[i]);
            for (std::size_t i = begin; i < end; ++i) add(rows[i]);
        }
        begin = end;
    }
}

struct Moments {
    std::size_t n = 0;
    double mean = 0.0;
    double m2 = 0.0;

    void add(double x) {
        ++n;
        double delta = x - mean;
        mean += delta / static_cast<double>(n);
        m2 += delta * (x - mean);
    }

    double std_dev() const { return n > 0 ? std::sqrt(m2 / static_cast<double>(n)) : 0.0; }
};

struct Tally {
    int wins = 0;
    int games = 0;

    double rate() const {
        return games > 0 ? static_cast<double>(wins) / games : neutral_rate;
    }
};

struct Average {
    double sum = 0.0;
    int count = 0;

    std::optional<double> value() const {
        if (count == 0) return std::nullopt;
        return sum / count;
    }
};

std::string upper(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

double number_or_zero(const Record& r, const std::string& column) {
    return r.number(column).value_or(0.0);
}

std::optional<double> pythagorean_pct(double gf, double ga) {
    if (gf <= 0.0 || ga <= 0.0) return std::nullopt;
    return gf * gf / (gf * gf + ga * ga);
}

std::vector<double> min_max_scale(const std::vector<std::optional<double>>& values) {
    double lo = 0.0, hi = 0.0;
    bool seen = false;
    for (auto& v : values) {
        if (!v) continue;
        lo = seen ? std::min(lo, *v) : *v;
        hi = seen ? std::max(hi, *v) : *v;
        seen = true;
    }

    std::vector<double> scaled;
    scaled.reserve(values.size());
    for (auto& v : values) {
        if (!v || hi - lo < 1e-12) {
            scaled.push_back(neutral_rate);
        } else {
            scaled.push_back((*v - lo) / (hi - lo));
        }
    }
    return scaled;
}

} // namespace

std::optional<AggregateScope> parse_scope(std::string_view text) {
    if (text == "season") return AggregateScope::Season;
    if (text == "as_of_row") return AggregateScope::AsOfRow;
    if (text == "strictly_past") return AggregateScope::StrictlyPast;
    return std::nullopt;
}

std::string_view to_string(AggregateScope scope) {
    switch (scope) {
        case AggregateScope::Season: return "season";
        case AggregateScope::AsOfRow: return "as_of_row";
        case AggregateScope::StrictlyPast: return "strictly_past";
    }
    return "season";
}

FeatureResult pythagorean(const RowTable& table, const PythagoreanOptions& options,
                          spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.goals_for, options.goals_against, options.games});
        !ok) {
        return std::unexpected(ok.error());
    }
    bool with_luck = !options.wins.empty();
    if (with_luck) {
        if (auto ok = require_columns(table, {options.wins}); !ok) return std::unexpected(ok.error());
    }

    log.info("Calculating Pythagorean expected wins");

    auto pct = make_column("pythagorean_win_pct", table);
    auto expected = make_column("pythagorean_wins", table);
    auto luck = make_column("luck_factor", table);

    int undefined = 0;
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto& r = table.rows[i];
        auto p = pythagorean_pct(number_or_zero(r, options.goals_for),
                                 number_or_zero(r, options.goals_against));
        if (!p) {
            ++undefined;
            continue;
        }
        pct.values[i] = *p;

        auto games = r.number(options.games);
        if (!games) continue;
        expected.values[i] = *p * *games;

        if (with_luck) {
            if (auto wins = r.number(options.wins)) luck.values[i] = *wins - *p * *games;
        }
    }

    if (undefined > 0) {
        log.debug("Pythagorean expectation undefined for {} rows without goals", undefined);
    }

    std::vector<FeatureColumn> result{std::move(pct), std::move(expected)};
    if (with_luck) result.push_back(std::move(luck));
    return result;
}

FeatureResult team_strength_index(const RowTable& table, const StrengthIndexOptions& options,
                                  spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.wins, options.losses, options.goal_diff}); !ok) {
        return std::unexpected(ok.error());
    }

    log.info("Calculating team strength index");

    auto win_rate = make_column("win_rate", table);
    auto strength = make_column("team_strength_index", table);

    for (std::size_t i = 0; i < table.size(); ++i) {
        auto& r = table.rows[i];
        double wins = number_or_zero(r, options.wins);
        double losses = number_or_zero(r, options.losses);
        double diff = number_or_zero(r, options.goal_diff);

        double games = wins + losses;
        double rate = games > 0.0 ? wins / games : neutral_rate;

        win_rate.values[i] = rate;
        strength.values[i] = rate * 50.0 + diff * 0.5;
    }

    return std::vector<FeatureColumn>{std::move(win_rate), std::move(strength)};
}

FeatureResult enhanced_strength_index(const RowTable& table,
                                      const EnhancedStrengthOptions& options,
                                      spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.goals_for, options.goals_against,
                                          options.games, options.wins});
        !ok) {
        return std::unexpected(ok.error());
    }

    log.info("Calculating enhanced strength index");

    std::size_t n = table.size();
    std::vector<double> win_rate(n, neutral_rate), pyth(n, neutral_rate);
    std::vector<std::optional<double>> diff_pg(n), gf_pg(n), ga_pg(n);

    for (std::size_t i = 0; i < n; ++i) {
        auto& r = table.rows[i];
        double gf = number_or_zero(r, options.goals_for);
        double ga = number_or_zero(r, options.goals_against);
        double games = number_or_zero(r, options.games);

        pyth[i] = pythagorean_pct(gf, ga).value_or(neutral_rate);
        if (games <= 0.0) continue;

        win_rate[i] = std::clamp(number_or_zero(r, options.wins) / games, 0.0, 1.0);
        diff_pg[i] = (gf - ga) / games;
        gf_pg[i] = gf / games;
        ga_pg[i] = ga / games;
    }

    auto diff_scaled = min_max_scale(diff_pg);
    auto gf_scaled = min_max_scale(gf_pg);
    auto ga_scaled = min_max_scale(ga_pg);

    auto out = make_column("enhanced_strength_index", table);
    for (std::size_t i = 0; i < n; ++i) {
        double score = 0.30 * win_rate[i] + 0.20 * diff_scaled[i] + 0.30 * pyth[i] +
                       0.10 * gf_scaled[i] + 0.10 * (1.0 - ga_scaled[i]);
        out.values[i] = std::clamp(score * 100.0, 0.0, 100.0);
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

FeatureResult consistency(const RowTable& table, const GroupedSeries& series,
                          const ConsistencyOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.score_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating consistency of '{}' ({})", options.score_column, to_string(options.scope));

    auto mean = make_column("score_mean", table);
    auto std_dev = make_column("score_std_dev", table);
    auto cv = make_column("score_cv", table);
    auto score = make_column("consistency_score", table);

    int undefined = 0;
    for (auto& group : series.groups) {
        Moments m;
        scan_scoped(
            group.rows, group.order_keys, options.scope,
            [&](std::size_t row) {
                if (auto v = table.rows[row].number(options.score_column)) m.add(*v);
            },
            [&](std::size_t row) {
                if (m.n == 0) return;
                mean.values[row] = m.mean;
                std_dev.values[row] = m.std_dev();
                if (m.mean == 0.0) {
                    ++undefined;
                    return;
                }
                double c = m.std_dev() / m.mean;
                cv.values[row] = c;
                score.values[row] = 1.0 - c;
            });
    }

    if (undefined > 0) {
        log.warn("Coefficient of variation undefined (zero mean) for {} rows", undefined);
    }

    return std::vector<FeatureColumn>{
        std::move(mean), std::move(std_dev), std::move(cv), std::move(score)};
}

FeatureResult clutch_factor(const RowTable& table, const GroupedSeries& series,
                            const ClutchOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.goal_diff_column, options.result_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating clutch performance in close games ({})", to_string(options.scope));

    auto out = make_column("clutch_factor", table);

    for (auto& group : series.groups) {
        Tally close;
        scan_scoped(
            group.rows, group.order_keys, options.scope,
            [&](std::size_t row) {
                auto& r = table.rows[row];
                auto diff = r.number(options.goal_diff_column);
                if (!diff || std::abs(*diff) > options.close_margin) return;
                ++close.games;
                if (outcome(r, options.result_column).value_or(false)) ++close.wins;
            },
            [&](std::size_t row) { out.values[row] = close.rate(); });
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

FeatureResult strength_of_schedule(const RowTable& table, const GroupedSeries& series,
                                   const ScheduleOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.opponent_wins_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating strength of schedule ({})", to_string(options.scope));

    auto out = make_column("strength_of_schedule", table);

    for (auto& group : series.groups) {
        Average opponents;
        scan_scoped(
            group.rows, group.order_keys, options.scope,
            [&](std::size_t row) {
                if (auto w = table.rows[row].number(options.opponent_wins_column)) {
                    opponents.sum += *w;
                    ++opponents.count;
                }
            },
            [&](std::size_t row) { out.values[row] = opponents.value().value_or(neutral_rate); });
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

FeatureResult head_to_head(const RowTable& table, const GroupedSeries& series,
                           const HeadToHeadOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.team_column, options.opponent_column,
                                          options.result_column});
        !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating head-to-head records ({})", to_string(options.scope));

    constexpr char sep = '\x1f';
    auto directed_key = [&](const std::string& a, const std::string& b) { return a + sep + b; };
    auto pair_key = [&](const std::string& a, const std::string& b) {
        return a < b ? directed_key(a, b) : directed_key(b, a);
    };

    std::unordered_map<std::string, int> pair_games;
    std::unordered_map<std::string, int> directed_wins;
    auto out = make_column("h2h_win_rate", table);

    auto timeline = chronological_order(series);
    scan_scoped(
        timeline.rows, timeline.order_keys, options.scope,
        [&](std::size_t row) {
            auto& r = table.rows[row];
            auto team = r.text(options.team_column);
            auto opp = r.text(options.opponent_column);
            if (!team || !opp) return;
            ++pair_games[pair_key(*team, *opp)];
            if (outcome(r, options.result_column).value_or(false)) {
                ++directed_wins[directed_key(*team, *opp)];
            }
        },
        [&](std::size_t row) {
            auto& r = table.rows[row];
            auto team = r.text(options.team_column);
            auto opp = r.text(options.opponent_column);
            if (!team || !opp) return;

            auto games_it = pair_games.find(pair_key(*team, *opp));
            int games = games_it == pair_games.end() ? 0 : games_it->second;
            if (games == 0) {
                out.values[row] = neutral_rate;
                return;
            }
            auto wins_it = directed_wins.find(directed_key(*team, *opp));
            int wins = wins_it == directed_wins.end() ? 0 : wins_it->second;
            out.values[row] = static_cast<double>(wins) / games;
        });

    return std::vector<FeatureColumn>{std::move(out)};
}

FeatureResult conference_adjustments(const RowTable& table, const GroupedSeries& series,
                                     const ConferenceOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.conference_column, options.win_pct_column}); !ok) {
        return std::unexpected(ok.error());
    }
    bool with_division = !options.division_column.empty();
    if (with_division) {
        if (auto ok = require_columns(table, {options.division_column}); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating conference/division strength adjustments ({})",
             to_string(options.scope));

    std::unordered_map<std::string, Average> by_conference;
    std::unordered_map<std::string, Average> by_division;

    auto conf_strength = make_column("conference_strength", table);
    auto div_strength = make_column("division_strength", table);
    auto adjusted = make_column("adjusted_win_pct", table);

    int undefined = 0;
    auto timeline = chronological_order(series);
    scan_scoped(
        timeline.rows, timeline.order_keys, options.scope,
        [&](std::size_t row) {
            auto& r = table.rows[row];
            auto pct = r.number(options.win_pct_column);
            if (!pct) return;
            if (auto conf = r.text(options.conference_column)) {
                auto& avg = by_conference[*conf];
                avg.sum += *pct;
                ++avg.count;
            }
            if (with_division) {
                if (auto div = r.text(options.division_column)) {
                    auto& avg = by_division[*div];
                    avg.sum += *pct;
                    ++avg.count;
                }
            }
        },
        [&](std::size_t row) {
            auto& r = table.rows[row];
            if (with_division) {
                if (auto div = r.text(options.division_column)) {
                    if (auto it = by_division.find(*div); it != by_division.end()) {
                        div_strength.values[row] = it->second.value();
                    }
                }
            }

            auto conf = r.text(options.conference_column);
            if (!conf) return;
            auto it = by_conference.find(*conf);
            if (it == by_conference.end()) return;
            auto conf_avg = it->second.value();
            conf_strength.values[row] = conf_avg;

            auto pct = r.number(options.win_pct_column);
            if (!pct || !conf_avg) return;
            if (*conf_avg == 0.0) {
                ++undefined;
                return;
            }
            adjusted.values[row] = *pct / *conf_avg * 0.5;
        });

    if (undefined > 0) {
        log.warn("Adjusted win % undefined (zero conference average) for {} rows", undefined);
    }

    std::vector<FeatureColumn> result{std::move(conf_strength)};
    if (with_division) result.push_back(std::move(div_strength));
    result.push_back(std::move(adjusted));
    return result;
}

FeatureResult home_away_splits(const RowTable& table, const GroupedSeries& series,
                               const HomeAwayOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.location_column, options.result_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating home/away performance splits ({})", to_string(options.scope));

    auto home_rate = make_column("home_win_rate", table);
    auto away_rate = make_column("away_win_rate", table);
    auto diff = make_column("home_away_diff", table);

    for (auto& group : series.groups) {
        Tally home, away;
        scan_scoped(
            group.rows, group.order_keys, options.scope,
            [&](std::size_t row) {
                auto& r = table.rows[row];
                auto loc = r.text(options.location_column);
                if (!loc) return;
                auto where = upper(*loc);
                Tally* t = where == "HOME" ? &home : where == "AWAY" ? &away : nullptr;
                if (!t) return;
                ++t->games;
                if (outcome(r, options.result_column).value_or(false)) ++t->wins;
            },
            [&](std::size_t row) {
                home_rate.values[row] = home.rate();
                away_rate.values[row] = away.rate();
                diff.values[row] = home.rate() - away.rate();
            });
    }

    return std::vector<FeatureColumn>{std::move(home_rate), std::move(away_rate), std::move(diff)};
}

} // namespace matchfeat
