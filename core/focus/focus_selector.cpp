#include "focus/focus_selector.hpp"

namespace keydr {

std::optional<FocusTarget> FocusSelection::primary() const {
    FocusTarget target;
    if (pair_focus.has_value()) {
        target.kind = FocusTarget::Kind::Pair;
        target.pair = pair_focus->key;
        return target;
    }
    if (char_focus.has_value()) {
        target.kind = FocusTarget::Kind::Symbol;
        target.symbol = *char_focus;
        return target;
    }
    return std::nullopt;
}

FocusSelection selectFocus(const SkillTree& tree,
                           const Scope& scope,
                           const SymbolStatsStore& symbol_stats,
                           const PairStatsStore& bigram_stats) {
    FocusSelection selection;
    selection.char_focus = tree.focusedSymbol(scope, symbol_stats);

    std::unordered_set<Symbol> unlocked = tree.unlockedSet(scope);
    selection.pair_focus = bigram_stats.worstConfirmedAnomaly(symbol_stats, nullptr, &unlocked);
    return selection;
}

} // namespace keydr
