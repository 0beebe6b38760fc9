#pragma once

#include "symbol/symbol.hpp"

#include <cstddef>
#include <limits>
#include <unordered_map>
#include <vector>

namespace keydr {

constexpr double kDefaultEmaAlpha = 0.1;
constexpr double kDefaultTargetCpm = 175.0;
constexpr double kNeutralErrorRate = 0.5;
constexpr size_t kMaxRecentTimes = 30;

/// (errors + 1) / (total + 2). Always strictly inside (0, 1).
double laplaceErrorRate(size_t errors, size_t total);

// ─── Symbol Stat ───────────────────────────────────────────────
// Rolling summary for one symbol. confidence and error_rate_ema only
// carry information once sample_count / total_count are non-zero.

struct SymbolStat {
    double filtered_time_ms = 1000.0;
    double best_time_ms = std::numeric_limits<double>::max();
    double confidence = 0.0;
    size_t sample_count = 0;
    size_t error_count = 0;
    size_t total_count = 0;
    double error_rate_ema = kNeutralErrorRate;
    std::vector<double> recent_times;
};

// ─── Symbol Stats Store ────────────────────────────────────────
// Per-symbol timing and error EMAs. Entries are created on first
// observation and never removed. Queries for a symbol that was never
// observed return defined defaults instead of failing.

class SymbolStatsStore {
public:
    explicit SymbolStatsStore(double target_cpm = kDefaultTargetCpm,
                              double alpha = kDefaultEmaAlpha);

    /// Record a correctly typed symbol and the time it took.
    void updateCorrect(Symbol symbol, double time_ms);

    /// Record a mistyped symbol. Timing is left untouched.
    void updateError(Symbol symbol);

    /// error_rate_ema of an observed symbol, kNeutralErrorRate otherwise.
    double smoothedErrorRate(Symbol symbol) const;

    /// Laplace-smoothed lifetime error rate, for display.
    double laplaceRate(Symbol symbol) const;

    /// Confidence of an observed symbol, 0.0 for one never practiced.
    double confidence(Symbol symbol) const;

    /// Stat of an observed symbol, nullptr if it was never observed.
    const SymbolStat* find(Symbol symbol) const;

    /// Insert or replace a stat verbatim (used when loading saved state).
    void insert(Symbol symbol, const SymbolStat& stat);

    /// Change the target speed and recompute every confidence.
    void setTargetCpm(double target_cpm);
    double targetCpm() const { return target_cpm_; }
    double targetTimeMs() const { return 60000.0 / target_cpm_; }
    double alpha() const { return alpha_; }

    size_t count() const { return stats_.size(); }
    const std::unordered_map<Symbol, SymbolStat>& all() const { return stats_; }

    /// Symbols sorted by code point, for stable output.
    std::vector<Symbol> sortedSymbols() const;

    void clear() { stats_.clear(); }

private:
    double target_cpm_;
    double alpha_;
    std::unordered_map<Symbol, SymbolStat> stats_;
};

} // namespace keydr
