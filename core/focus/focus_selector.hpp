#pragma once

#include "stats/pair_stats.hpp"
#include "stats/symbol_stats.hpp"
#include "tree/skill_tree.hpp"

#include <optional>

namespace keydr {

// ─── Focus Target ──────────────────────────────────────────────
// The one thing a consumer biases toward when it can pick only one.

struct FocusTarget {
    enum class Kind { Symbol, Pair };

    Kind kind = Kind::Symbol;
    Symbol symbol = 0;    // valid when kind == Symbol
    PairKey pair;         // valid when kind == Pair

    bool operator==(const FocusTarget& other) const {
        if (kind != other.kind) return false;
        return kind == Kind::Symbol ? symbol == other.symbol : pair == other.pair;
    }
};

// ─── Focus Selection ───────────────────────────────────────────
// Snapshot taken when a session's text is generated and held until the
// next session. Both fields may be set at once.

struct FocusSelection {
    std::optional<Symbol> char_focus;
    std::optional<PairAnomaly> pair_focus;

    /// A confirmed pair anomaly outranks the symbol focus. The two are
    /// never compared numerically.
    std::optional<FocusTarget> primary() const;
};

/// Weakest unlocked symbol for `scope` plus the worst confirmed anomaly
/// among bigrams made only of symbols unlocked in `scope`.
FocusSelection selectFocus(const SkillTree& tree,
                           const Scope& scope,
                           const SymbolStatsStore& symbol_stats,
                           const PairStatsStore& bigram_stats);

} // namespace keydr
