#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keydr {

// ─── Session Summary ───────────────────────────────────────────
// Aggregate numbers of one finished session, used for scoring.

struct SessionSummary {
    double cpm = 0.0;
    size_t total_chars = 0;
    size_t incorrect = 0;
    double elapsed_ms = 0.0;
};

/// cpm × complexity / (errors + 1) × (length / 50).
double computeScore(const SessionSummary& summary, double complexity);

/// Profile level: max(1, floor(sqrt(total / 100))).
uint32_t levelFromScore(double total_score);

/// Points left until the next profile level.
double scoreToNextLevel(double total_score);

// ─── Learning Trend ────────────────────────────────────────────
// Linear fit over a symbol's recent times. Only trusted when the fit
// explains at least half of the variance.

/// Predicted next time, std::nullopt with < 3 samples, flat data or a
/// poor fit (r² < 0.5).
std::optional<double> predictNextTime(const std::vector<double>& times);

/// "Improving", "Slowing down", "Steady" or "Not enough data". A
/// non-positive latest time has no meaningful relative change.
std::string trendLabel(const std::vector<double>& times);

} // namespace keydr
