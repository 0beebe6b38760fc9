#pragma once

#include "stats/pair_stats.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace keydr {

// ─── Engine Config ─────────────────────────────────────────────
// Externally supplied constants. Nothing here is derived from data.

struct EngineConfig {
    uint32_t target_wpm = 35;
    double ema_alpha = 0.1;

    // Anomaly gates
    double error_anomaly_ratio = 1.5;
    double speed_anomaly_pct = 50.0;
    uint32_t streak_required = 3;
    size_t min_pair_samples = 20;
    size_t min_symbol_samples_for_speed = 10;

    // Trigram table cap
    size_t max_trigrams = 5000;

    // Hesitation: max(floor, multiplier × rolling median)
    double hesitation_floor_ms = 800.0;
    double hesitation_multiplier = 2.5;
    size_t median_window = 2000;

    std::string log_level = "info";

    /// Five characters per word.
    double targetCpm() const { return static_cast<double>(target_wpm) * 5.0; }

    AnomalyThresholds anomalyThresholds() const;

    /// Throws std::runtime_error naming the first out-of-range field.
    void validate() const;
};

/// Read a JSON config file. A missing file yields defaults; keys absent
/// from the file keep their defaults. Throws std::runtime_error on
/// malformed JSON or a bad value.
EngineConfig loadConfig(const std::string& path);

/// Write the config as pretty JSON. Throws std::runtime_error on I/O
/// failure.
void saveConfig(const std::string& path, const EngineConfig& config);

} // namespace keydr
