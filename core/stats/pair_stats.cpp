#include "stats/pair_stats.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace keydr {

namespace {

uint8_t saturatingIncrement(uint8_t value) {
    return value == std::numeric_limits<uint8_t>::max() ? value : static_cast<uint8_t>(value + 1);
}

} // namespace

std::string PairKey::toString() const {
    std::string out;
    for (uint8_t i = 0; i < order; i++) {
        out += symbols::toUtf8(symbols[i]);
    }
    return out;
}

const char* anomalyKindName(AnomalyKind kind) {
    return kind == AnomalyKind::Error ? "error" : "speed";
}

PairStatsStore::PairStatsStore(uint8_t order, double target_cpm, double alpha,
                               AnomalyThresholds thresholds)
    : order_(order), target_cpm_(target_cpm), alpha_(alpha), thresholds_(thresholds) {}

void PairStatsStore::update(const PairKey& key, double time_ms, bool correct,
                            bool hesitation, uint32_t session_index) {
    PairStat& stat = stats_[key];
    stat.last_seen_session = session_index;
    stat.sample_count++;
    if (!correct) stat.error_count++;
    if (hesitation) stat.hesitation_count++;

    double signal = correct ? 0.0 : 1.0;
    if (stat.sample_count == 1) {
        stat.filtered_time_ms = time_ms;
        stat.error_rate_ema = signal;
    } else {
        stat.filtered_time_ms = alpha_ * time_ms + (1.0 - alpha_) * stat.filtered_time_ms;
        stat.error_rate_ema = alpha_ * signal + (1.0 - alpha_) * stat.error_rate_ema;
    }
    stat.best_time_ms = std::min(stat.best_time_ms, stat.filtered_time_ms);
    stat.confidence = targetTimeMs() / stat.filtered_time_ms;

    stat.recent_times.push_back(time_ms);
    if (stat.recent_times.size() > kMaxRecentTimes) {
        stat.recent_times.erase(stat.recent_times.begin());
    }
}

double PairStatsStore::smoothedErrorRate(const PairKey& key) const {
    auto it = stats_.find(key);
    return it != stats_.end() ? it->second.error_rate_ema : kNeutralErrorRate;
}

double PairStatsStore::expectedErrorRate(const PairKey& key,
                                         const SymbolStatsStore& symbols,
                                         const PairStatsStore* sub_pairs) const {
    double all_clean = 1.0;
    for (uint8_t i = 0; i < key.order; i++) {
        all_clean *= 1.0 - symbols.smoothedErrorRate(key[i]);
    }
    double expected = 1.0 - all_clean;

    if (key.order == 3 && sub_pairs != nullptr) {
        double from_sub_pairs = std::max(sub_pairs->smoothedErrorRate(key.head()),
                                         sub_pairs->smoothedErrorRate(key.tail()));
        expected = std::max(expected, from_sub_pairs);
    }
    return expected;
}

double PairStatsStore::errorAnomalyRatio(const PairKey& key,
                                         const SymbolStatsStore& symbols,
                                         const PairStatsStore* sub_pairs) const {
    double expected = expectedErrorRate(key, symbols, sub_pairs);
    return smoothedErrorRate(key) / std::max(expected, thresholds_.expected_floor);
}

std::optional<double> PairStatsStore::speedAnomalyPct(const PairKey& key,
                                                      const SymbolStatsStore& symbols) const {
    auto it = stats_.find(key);
    if (it == stats_.end() || it->second.sample_count == 0) return std::nullopt;

    // The first symbol's time belongs to the transition into the window.
    double baseline = 0.0;
    for (uint8_t i = 1; i < key.order; i++) {
        const SymbolStat* stat = symbols.find(key[i]);
        if (stat == nullptr || stat->sample_count < thresholds_.min_symbol_samples_for_speed) {
            return std::nullopt;
        }
        baseline += stat->filtered_time_ms;
    }
    if (baseline <= 0.0) return std::nullopt;

    return (it->second.filtered_time_ms / baseline - 1.0) * 100.0;
}

void PairStatsStore::updateAnomalyStreaks(const PairKey& key,
                                          const SymbolStatsStore& symbols,
                                          const PairStatsStore* sub_pairs) {
    auto it = stats_.find(key);
    if (it == stats_.end()) return;
    PairStat& stat = it->second;

    bool was_error_confirmed = isErrorConfirmed(key);
    bool was_speed_confirmed = isSpeedConfirmed(key);

    if (errorQualifies(errorAnomalyRatio(key, symbols, sub_pairs))) {
        stat.error_anomaly_streak = saturatingIncrement(stat.error_anomaly_streak);
    } else {
        stat.error_anomaly_streak = 0;
    }

    // Unknown speed holds the streak as it is.
    std::optional<double> speed = speedAnomalyPct(key, symbols);
    if (speed.has_value()) {
        if (speedQualifies(*speed)) {
            stat.speed_anomaly_streak = saturatingIncrement(stat.speed_anomaly_streak);
        } else {
            stat.speed_anomaly_streak = 0;
        }
    }

    if (!was_error_confirmed && isErrorConfirmed(key)) {
        spdlog::info("Pair '{}' confirmed as error anomaly", key.toString());
    }
    if (!was_speed_confirmed && isSpeedConfirmed(key)) {
        spdlog::info("Pair '{}' confirmed as speed anomaly", key.toString());
    }
}

bool PairStatsStore::isErrorConfirmed(const PairKey& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) return false;
    return it->second.error_anomaly_streak >= thresholds_.streak_required &&
           it->second.sample_count >= thresholds_.min_pair_samples;
}

bool PairStatsStore::isSpeedConfirmed(const PairKey& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) return false;
    return it->second.speed_anomaly_streak >= thresholds_.streak_required &&
           it->second.sample_count >= thresholds_.min_pair_samples;
}

std::vector<PairAnomaly> PairStatsStore::confirmedAnomalies(
    const SymbolStatsStore& symbols,
    const PairStatsStore* sub_pairs,
    const std::unordered_set<Symbol>* allowed) const {

    std::vector<PairAnomaly> result;
    for (const auto& [key, stat] : stats_) {
        if (allowed != nullptr) {
            bool all_allowed = true;
            for (uint8_t i = 0; i < key.order; i++) {
                if (allowed->count(key[i]) == 0) {
                    all_allowed = false;
                    break;
                }
            }
            if (!all_allowed) continue;
        }

        std::optional<PairAnomaly> best;
        if (isErrorConfirmed(key)) {
            double ratio = errorAnomalyRatio(key, symbols, sub_pairs);
            if (errorQualifies(ratio)) {
                best = PairAnomaly{key, (ratio - 1.0) * 100.0, AnomalyKind::Error};
            }
        }
        if (isSpeedConfirmed(key)) {
            std::optional<double> pct = speedAnomalyPct(key, symbols);
            if (pct.has_value() && speedQualifies(*pct)) {
                // Error wins ties
                if (!best.has_value() || *pct > best->anomaly_pct) {
                    best = PairAnomaly{key, *pct, AnomalyKind::Speed};
                }
            }
        }
        if (best.has_value()) result.push_back(*best);
    }

    std::sort(result.begin(), result.end(), [](const PairAnomaly& a, const PairAnomaly& b) {
        if (a.anomaly_pct != b.anomaly_pct) return a.anomaly_pct > b.anomaly_pct;
        return a.key < b.key;
    });
    return result;
}

std::optional<PairAnomaly> PairStatsStore::worstConfirmedAnomaly(
    const SymbolStatsStore& symbols,
    const PairStatsStore* sub_pairs,
    const std::unordered_set<Symbol>* allowed) const {

    std::vector<PairAnomaly> anomalies = confirmedAnomalies(symbols, sub_pairs, allowed);
    if (anomalies.empty()) return std::nullopt;
    return anomalies.front();
}

size_t PairStatsStore::prune(size_t max_entries, uint32_t total_sessions,
                             const SymbolStatsStore& symbols,
                             const PairStatsStore* sub_pairs) {
    if (stats_.size() <= max_entries) return 0;

    const double recency_weight = 0.3;
    const double signal_weight = 0.5;
    const double data_weight = 0.2;

    std::vector<std::pair<PairKey, double>> scored;
    scored.reserve(stats_.size());
    for (const auto& [key, stat] : stats_) {
        uint32_t since = total_sessions > stat.last_seen_session
            ? total_sessions - stat.last_seen_session : 0;
        double recency = 1.0 / (static_cast<double>(since) + 1.0);
        double signal = std::min(errorAnomalyRatio(key, symbols, sub_pairs), 3.0);
        double data = std::log1p(static_cast<double>(stat.sample_count));
        scored.emplace_back(key, recency_weight * recency + signal_weight * signal + data_weight * data);
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    size_t removed = 0;
    for (size_t i = max_entries; i < scored.size(); i++) {
        removed += stats_.erase(scored[i].first);
    }
    spdlog::debug("Pruned {} order-{} pairs, {} remain", removed, order_, stats_.size());
    return removed;
}

double PairStatsStore::marginalGain(const SymbolStatsStore& symbols,
                                    const PairStatsStore* sub_pairs) const {
    size_t qualified = 0;
    size_t with_signal = 0;
    for (const auto& [key, stat] : stats_) {
        if (stat.sample_count < thresholds_.min_pair_samples) continue;
        qualified++;
        if (errorQualifies(errorAnomalyRatio(key, symbols, sub_pairs))) {
            with_signal++;
        }
    }
    if (qualified == 0) return 0.0;
    return static_cast<double>(with_signal) / qualified;
}

const PairStat* PairStatsStore::find(const PairKey& key) const {
    auto it = stats_.find(key);
    return it != stats_.end() ? &it->second : nullptr;
}

void PairStatsStore::insert(const PairKey& key, const PairStat& stat) {
    stats_[key] = stat;
}

void PairStatsStore::setTargetCpm(double target_cpm) {
    target_cpm_ = target_cpm;
    for (auto& [key, stat] : stats_) {
        if (stat.sample_count > 0) {
            stat.confidence = targetTimeMs() / stat.filtered_time_ms;
        }
    }
}

} // namespace keydr
