#pragma once

#include "stats/symbol_stats.hpp"
#include "symbol/symbol.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace keydr {

// ─── Pair Key ──────────────────────────────────────────────────
// An ordered run of 2 (bigram) or 3 (trigram) symbols.

struct PairKey {
    std::array<Symbol, 3> symbols{};
    uint8_t order = 0;

    PairKey() = default;
    PairKey(Symbol a, Symbol b) : symbols{a, b, 0}, order(2) {}
    PairKey(Symbol a, Symbol b, Symbol c) : symbols{a, b, c}, order(3) {}

    Symbol operator[](size_t i) const { return symbols[i]; }

    /// Leading and trailing sub-pairs of a trigram.
    PairKey head() const { return PairKey(symbols[0], symbols[1]); }
    PairKey tail() const { return PairKey(symbols[1], symbols[2]); }

    /// UTF-8 rendering, e.g. "th".
    std::string toString() const;

    bool operator==(const PairKey& other) const {
        return order == other.order && symbols == other.symbols;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }
    bool operator<(const PairKey& other) const {
        if (order != other.order) return order < other.order;
        return symbols < other.symbols;
    }
};

struct PairKeyHash {
    size_t operator()(const PairKey& key) const {
        size_t h = key.order;
        for (Symbol s : key.symbols) {
            h = h * 1000003u ^ static_cast<size_t>(s);
        }
        return h;
    }
};

// ─── Anomaly ───────────────────────────────────────────────────

enum class AnomalyKind { Error, Speed };

const char* anomalyKindName(AnomalyKind kind);

struct PairAnomaly {
    PairKey key;
    double anomaly_pct = 0.0;
    AnomalyKind kind = AnomalyKind::Error;
};

/// Gates for anomaly qualification and confirmation.
struct AnomalyThresholds {
    double error_ratio = 1.5;          // ratio must exceed this to qualify
    double speed_pct = 50.0;           // slowdown % must exceed this
    uint8_t streak_required = 3;       // consecutive qualifying checks
    size_t min_pair_samples = 20;
    size_t min_symbol_samples_for_speed = 10;
    double expected_floor = 0.01;      // denominator floor for the ratio
};

// ─── Pair Stat ─────────────────────────────────────────────────

struct PairStat {
    double filtered_time_ms = 1000.0;
    double best_time_ms = std::numeric_limits<double>::max();
    double confidence = 0.0;
    size_t sample_count = 0;
    size_t error_count = 0;
    size_t hesitation_count = 0;
    double error_rate_ema = kNeutralErrorRate;
    uint8_t error_anomaly_streak = 0;
    uint8_t speed_anomaly_streak = 0;
    uint32_t last_seen_session = 0;
    std::vector<double> recent_times;
};

// ─── Pair Stats Store ──────────────────────────────────────────
// Transition statistics for one pair order. Two independent signals
// are derived per pair:
//   error anomaly: e_pair / expected, expected = 1 - Π(1 - e_i) over the
//                  constituent symbols (and, for trigrams, at least the
//                  worse constituent bigram)
//   speed anomaly: pair time vs. the same symbols typed in isolation;
//                  unknown until the baseline symbols have enough samples
// A signal is confirmed after a run of consecutive qualifying session
// checks plus a minimum sample count.

class PairStatsStore {
public:
    explicit PairStatsStore(uint8_t order,
                            double target_cpm = kDefaultTargetCpm,
                            double alpha = kDefaultEmaAlpha,
                            AnomalyThresholds thresholds = {});

    /// Record one observation of a pair.
    void update(const PairKey& key, double time_ms, bool correct,
                bool hesitation, uint32_t session_index);

    /// error_rate_ema of an observed pair, kNeutralErrorRate otherwise.
    double smoothedErrorRate(const PairKey& key) const;

    /// Error rate expected if the pair were no harder than its parts.
    /// `sub_pairs` is the order-2 store, consulted for trigrams only.
    double expectedErrorRate(const PairKey& key,
                             const SymbolStatsStore& symbols,
                             const PairStatsStore* sub_pairs = nullptr) const;

    /// e_pair / max(expected, floor).
    double errorAnomalyRatio(const PairKey& key,
                             const SymbolStatsStore& symbols,
                             const PairStatsStore* sub_pairs = nullptr) const;

    /// Slowdown in percent against the isolated-symbol baseline.
    /// std::nullopt when the baseline is not yet trustworthy.
    std::optional<double> speedAnomalyPct(const PairKey& key,
                                          const SymbolStatsStore& symbols) const;

    /// Re-evaluate both streaks of one pair. A qualifying check extends a
    /// streak, a failing one resets it, an unknown one holds it.
    void updateAnomalyStreaks(const PairKey& key,
                              const SymbolStatsStore& symbols,
                              const PairStatsStore* sub_pairs = nullptr);

    bool isErrorConfirmed(const PairKey& key) const;
    bool isSpeedConfirmed(const PairKey& key) const;

    /// Confirmed anomalies that still qualify, one per pair (the higher
    /// percentage axis, error on ties). When `allowed` is given, pairs
    /// containing any other symbol are skipped.
    std::vector<PairAnomaly> confirmedAnomalies(
        const SymbolStatsStore& symbols,
        const PairStatsStore* sub_pairs = nullptr,
        const std::unordered_set<Symbol>* allowed = nullptr) const;

    /// The single highest-percentage confirmed anomaly, if any.
    std::optional<PairAnomaly> worstConfirmedAnomaly(
        const SymbolStatsStore& symbols,
        const PairStatsStore* sub_pairs = nullptr,
        const std::unordered_set<Symbol>* allowed = nullptr) const;

    /// Shrink to `max_entries` by a weighted utility of recency, anomaly
    /// strength and sample volume. Returns the number of entries removed.
    size_t prune(size_t max_entries, uint32_t total_sessions,
                 const SymbolStatsStore& symbols,
                 const PairStatsStore* sub_pairs = nullptr);

    /// Fraction of well-sampled pairs whose error ratio qualifies.
    double marginalGain(const SymbolStatsStore& symbols,
                        const PairStatsStore* sub_pairs = nullptr) const;

    const PairStat* find(const PairKey& key) const;
    void insert(const PairKey& key, const PairStat& stat);

    uint8_t order() const { return order_; }
    double targetTimeMs() const { return order_ * 60000.0 / target_cpm_; }
    void setTargetCpm(double target_cpm);
    const AnomalyThresholds& thresholds() const { return thresholds_; }

    size_t count() const { return stats_.size(); }
    const std::unordered_map<PairKey, PairStat, PairKeyHash>& all() const { return stats_; }
    void clear() { stats_.clear(); }

private:
    uint8_t order_;
    double target_cpm_;
    double alpha_;
    AnomalyThresholds thresholds_;
    std::unordered_map<PairKey, PairStat, PairKeyHash> stats_;

    bool errorQualifies(double ratio) const { return ratio > thresholds_.error_ratio; }
    bool speedQualifies(double pct) const { return pct > thresholds_.speed_pct; }
};

} // namespace keydr
