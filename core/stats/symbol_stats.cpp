#include "stats/symbol_stats.hpp"

#include <algorithm>

namespace keydr {

double laplaceErrorRate(size_t errors, size_t total) {
    return (static_cast<double>(errors) + 1.0) / (static_cast<double>(total) + 2.0);
}

SymbolStatsStore::SymbolStatsStore(double target_cpm, double alpha)
    : target_cpm_(target_cpm), alpha_(alpha) {}

void SymbolStatsStore::updateCorrect(Symbol symbol, double time_ms) {
    SymbolStat& stat = stats_[symbol];
    stat.sample_count++;
    stat.total_count++;

    if (stat.sample_count == 1) {
        stat.filtered_time_ms = time_ms;
    } else {
        stat.filtered_time_ms = alpha_ * time_ms + (1.0 - alpha_) * stat.filtered_time_ms;
    }
    stat.best_time_ms = std::min(stat.best_time_ms, stat.filtered_time_ms);
    stat.confidence = targetTimeMs() / stat.filtered_time_ms;

    stat.recent_times.push_back(time_ms);
    if (stat.recent_times.size() > kMaxRecentTimes) {
        stat.recent_times.erase(stat.recent_times.begin());
    }

    // Correct stroke = 0.0 signal
    if (stat.total_count == 1) {
        stat.error_rate_ema = 0.0;
    } else {
        stat.error_rate_ema = (1.0 - alpha_) * stat.error_rate_ema;
    }
}

void SymbolStatsStore::updateError(Symbol symbol) {
    SymbolStat& stat = stats_[symbol];
    stat.error_count++;
    stat.total_count++;

    // Error stroke = 1.0 signal
    if (stat.total_count == 1) {
        stat.error_rate_ema = 1.0;
    } else {
        stat.error_rate_ema = alpha_ + (1.0 - alpha_) * stat.error_rate_ema;
    }
}

double SymbolStatsStore::smoothedErrorRate(Symbol symbol) const {
    auto it = stats_.find(symbol);
    return it != stats_.end() ? it->second.error_rate_ema : kNeutralErrorRate;
}

double SymbolStatsStore::laplaceRate(Symbol symbol) const {
    auto it = stats_.find(symbol);
    if (it == stats_.end()) return laplaceErrorRate(0, 0);
    return laplaceErrorRate(it->second.error_count, it->second.total_count);
}

double SymbolStatsStore::confidence(Symbol symbol) const {
    auto it = stats_.find(symbol);
    return it != stats_.end() ? it->second.confidence : 0.0;
}

const SymbolStat* SymbolStatsStore::find(Symbol symbol) const {
    auto it = stats_.find(symbol);
    return it != stats_.end() ? &it->second : nullptr;
}

void SymbolStatsStore::insert(Symbol symbol, const SymbolStat& stat) {
    stats_[symbol] = stat;
}

void SymbolStatsStore::setTargetCpm(double target_cpm) {
    target_cpm_ = target_cpm;
    for (auto& [symbol, stat] : stats_) {
        if (stat.sample_count > 0) {
            stat.confidence = targetTimeMs() / stat.filtered_time_ms;
        }
    }
}

std::vector<Symbol> SymbolStatsStore::sortedSymbols() const {
    std::vector<Symbol> result;
    result.reserve(stats_.size());
    for (const auto& [symbol, stat] : stats_) {
        result.push_back(symbol);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace keydr
