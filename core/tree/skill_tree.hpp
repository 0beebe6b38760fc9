#pragma once

#include "stats/symbol_stats.hpp"
#include "symbol/symbol.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace keydr {

// ─── Branch Status ─────────────────────────────────────────────

enum class BranchStatus { Locked, Available, InProgress, Complete };

const char* branchStatusName(BranchStatus status);
std::optional<BranchStatus> branchStatusFromName(const std::string& name);

// ─── Definitions ───────────────────────────────────────────────
// Immutable tree layout, injected at construction. A symbol may appear
// in several branches; its confidence is looked up once and shared.

struct LevelDefinition {
    std::string name;
    std::vector<Symbol> symbols;
};

struct BranchDefinition {
    std::string id;
    std::string name;
    std::vector<LevelDefinition> levels;
    // Cumulative branches gate and focus on every unlocked level rather
    // than the current one only.
    bool cumulative = false;

    /// Every symbol of every level, in level order, duplicates removed.
    std::vector<Symbol> allSymbols() const;
};

struct SkillTreeDefinition {
    std::string root_branch;
    std::vector<BranchDefinition> branches;

    const BranchDefinition* find(const std::string& id) const;

    /// Throws std::invalid_argument if ids repeat, the root is missing or
    /// a branch has an empty level list or an empty level.
    void validate() const;
};

// ─── Progress ──────────────────────────────────────────────────

struct BranchProgress {
    BranchStatus status = BranchStatus::Locked;
    size_t current_level = 0;
};

struct SkillTreeProgress {
    std::unordered_map<std::string, BranchProgress> branches;

    /// Root InProgress at level 0, every other branch Locked.
    static SkillTreeProgress initial(const SkillTreeDefinition& definition);
};

// ─── Scope ─────────────────────────────────────────────────────
// Global practice spans every active branch; branch practice targets
// one branch with the root branch as background.

struct Scope {
    std::optional<std::string> branch;

    static Scope global() { return Scope{}; }
    static Scope forBranch(const std::string& id) { return Scope{id}; }
    bool isGlobal() const { return !branch.has_value(); }
};

// ─── Changes ───────────────────────────────────────────────────
// Transitions produced by one update() call. Each entry is reported on
// the call where it happens and never again.

struct SkillTreeChanges {
    std::vector<std::string> newly_available;
    std::vector<std::string> newly_completed;
    bool all_symbols_unlocked = false;
    bool all_branches_complete = false;

    bool empty() const {
        return newly_available.empty() && newly_completed.empty() &&
               !all_symbols_unlocked && !all_branches_complete;
    }
};

// ─── Skill Tree ────────────────────────────────────────────────
// Branch state machine: Locked → Available → InProgress → Complete.
// Available branches start only on an explicit startBranch(). Levels
// inside an InProgress branch advance automatically once confident.

class SkillTree {
public:
    explicit SkillTree(SkillTreeDefinition definition);

    /// Restore saved progress. Entries for unknown branches are dropped,
    /// missing branches get their initial state and levels are clamped.
    SkillTree(SkillTreeDefinition definition, SkillTreeProgress progress);

    /// Recompute statuses from current confidences.
    SkillTreeChanges update(const SymbolStatsStore& stats);

    /// Available → InProgress. Returns false if the branch is in any
    /// other state. Throws std::invalid_argument for an unknown id.
    bool startBranch(const std::string& id);

    BranchStatus branchStatus(const std::string& id) const;
    const BranchProgress& branchProgress(const std::string& id) const;

    /// Symbols the generator may use in this scope.
    std::vector<Symbol> unlockedSymbols(const Scope& scope) const;
    std::unordered_set<Symbol> unlockedSet(const Scope& scope) const;

    /// Weakest not-yet-confident symbol among the focus candidates.
    std::optional<Symbol> focusedSymbol(const Scope& scope, const SymbolStatsStore& stats) const;

    size_t totalUniqueSymbols() const { return total_unique_symbols_; }
    size_t totalUnlockedCount() const;
    size_t branchTotalSymbols(const std::string& id) const;
    size_t branchConfidentSymbols(const std::string& id, const SymbolStatsStore& stats) const;

    /// unlocked / unique, floored at 0.1.
    double complexity() const;

    bool allBranchesComplete() const;

    const SkillTreeDefinition& definition() const { return definition_; }
    const SkillTreeProgress& progress() const { return progress_; }

private:
    SkillTreeDefinition definition_;
    SkillTreeProgress progress_;
    size_t total_unique_symbols_ = 0;

    const BranchDefinition& requireBranch(const std::string& id) const;

    /// Symbols of levels 0..current_level (all levels once Complete).
    std::vector<Symbol> branchUnlocked(const BranchDefinition& def) const;

    /// Symbols eligible as focus while the branch is InProgress.
    std::vector<Symbol> focusCandidates(const BranchDefinition& def) const;

    /// Advance levels and completion of one InProgress branch.
    void advanceBranch(const BranchDefinition& def, const SymbolStatsStore& stats);

    static bool allConfident(const std::vector<Symbol>& symbols, const SymbolStatsStore& stats);
    static std::optional<Symbol> weakest(const std::vector<Symbol>& candidates,
                                         const SymbolStatsStore& stats);
};

} // namespace keydr
