#pragma once

#include "stats/pair_stats.hpp"
#include "symbol/symbol.hpp"

#include <vector>

namespace keydr {

// ─── Key Time ──────────────────────────────────────────────────
// One keystroke of a session: the expected symbol, the time since the
// previous keystroke and whether the typed key matched.

struct KeyTime {
    Symbol symbol = 0;
    double time_ms = 0.0;
    bool correct = true;
};

// ─── Pair Event ────────────────────────────────────────────────

struct PairEvent {
    PairKey key;
    double time_ms = 0.0;   // transition time: every symbol but the first
    bool correct = true;    // all symbols in the window were correct
    bool hesitation = false;
};

struct PairEvents {
    std::vector<PairEvent> bigrams;
    std::vector<PairEvent> trigrams;
};

/// Slide 2- and 3-symbol windows over a session's keystrokes.
/// Correction markers are dropped first; windows never contain a word
/// boundary symbol. Pure function, no state.
PairEvents extractPairEvents(const std::vector<KeyTime>& keystrokes,
                             double hesitation_threshold_ms);

/// max(floor, multiplier × median). Adapts to the user's own pace.
double hesitationThreshold(double median_transition_ms,
                           double floor_ms = 800.0,
                           double multiplier = 2.5);

/// Median of the values, 0.0 if empty.
double computeMedian(std::vector<double> values);

} // namespace keydr
