#include "tree/skill_tree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace keydr {

namespace {

void appendUnique(std::vector<Symbol>& out, std::unordered_set<Symbol>& seen,
                  const std::vector<Symbol>& symbols) {
    for (Symbol s : symbols) {
        if (seen.insert(s).second) out.push_back(s);
    }
}

} // namespace

const char* branchStatusName(BranchStatus status) {
    switch (status) {
        case BranchStatus::Locked:     return "locked";
        case BranchStatus::Available:  return "available";
        case BranchStatus::InProgress: return "in_progress";
        case BranchStatus::Complete:   return "complete";
    }
    return "locked";
}

std::optional<BranchStatus> branchStatusFromName(const std::string& name) {
    if (name == "locked") return BranchStatus::Locked;
    if (name == "available") return BranchStatus::Available;
    if (name == "in_progress") return BranchStatus::InProgress;
    if (name == "complete") return BranchStatus::Complete;
    return std::nullopt;
}

std::vector<Symbol> BranchDefinition::allSymbols() const {
    std::vector<Symbol> result;
    std::unordered_set<Symbol> seen;
    for (const auto& level : levels) {
        appendUnique(result, seen, level.symbols);
    }
    return result;
}

const BranchDefinition* SkillTreeDefinition::find(const std::string& id) const {
    for (const auto& branch : branches) {
        if (branch.id == id) return &branch;
    }
    return nullptr;
}

void SkillTreeDefinition::validate() const {
    std::unordered_set<std::string> ids;
    for (const auto& branch : branches) {
        if (!ids.insert(branch.id).second) {
            throw std::invalid_argument("Duplicate branch id: " + branch.id);
        }
        if (branch.levels.empty()) {
            throw std::invalid_argument("Branch has no levels: " + branch.id);
        }
        for (const auto& level : branch.levels) {
            if (level.symbols.empty()) {
                throw std::invalid_argument("Empty level '" + level.name + "' in branch " + branch.id);
            }
        }
    }
    if (find(root_branch) == nullptr) {
        throw std::invalid_argument("Root branch not defined: " + root_branch);
    }
}

SkillTreeProgress SkillTreeProgress::initial(const SkillTreeDefinition& definition) {
    SkillTreeProgress progress;
    for (const auto& branch : definition.branches) {
        BranchProgress bp;
        if (branch.id == definition.root_branch) {
            bp.status = BranchStatus::InProgress;
        }
        progress.branches[branch.id] = bp;
    }
    return progress;
}

SkillTree::SkillTree(SkillTreeDefinition definition)
    : SkillTree(definition, SkillTreeProgress::initial(definition)) {}

SkillTree::SkillTree(SkillTreeDefinition definition, SkillTreeProgress progress)
    : definition_(std::move(definition)) {
    definition_.validate();

    SkillTreeProgress initial = SkillTreeProgress::initial(definition_);
    std::unordered_set<Symbol> all;
    for (const auto& branch : definition_.branches) {
        auto it = progress.branches.find(branch.id);
        BranchProgress bp = it != progress.branches.end() ? it->second : initial.branches[branch.id];
        bp.current_level = std::min(bp.current_level, branch.levels.size() - 1);
        progress_.branches[branch.id] = bp;

        for (Symbol s : branch.allSymbols()) all.insert(s);
    }
    total_unique_symbols_ = all.size();
}

const BranchDefinition& SkillTree::requireBranch(const std::string& id) const {
    const BranchDefinition* def = definition_.find(id);
    if (def == nullptr) {
        throw std::invalid_argument("Unknown branch: " + id);
    }
    return *def;
}

BranchStatus SkillTree::branchStatus(const std::string& id) const {
    return branchProgress(id).status;
}

const BranchProgress& SkillTree::branchProgress(const std::string& id) const {
    requireBranch(id);
    return progress_.branches.at(id);
}

bool SkillTree::startBranch(const std::string& id) {
    requireBranch(id);
    BranchProgress& bp = progress_.branches.at(id);
    if (bp.status != BranchStatus::Available) return false;
    bp.status = BranchStatus::InProgress;
    bp.current_level = 0;
    spdlog::info("Branch '{}' started", id);
    return true;
}

// ── Symbol sets ──

std::vector<Symbol> SkillTree::branchUnlocked(const BranchDefinition& def) const {
    const BranchProgress& bp = progress_.branches.at(def.id);
    std::vector<Symbol> result;
    std::unordered_set<Symbol> seen;
    if (bp.status == BranchStatus::Complete) {
        return def.allSymbols();
    }
    if (bp.status == BranchStatus::InProgress) {
        for (size_t i = 0; i <= bp.current_level && i < def.levels.size(); i++) {
            appendUnique(result, seen, def.levels[i].symbols);
        }
    }
    return result;
}

std::vector<Symbol> SkillTree::focusCandidates(const BranchDefinition& def) const {
    const BranchProgress& bp = progress_.branches.at(def.id);
    if (bp.status != BranchStatus::InProgress) return {};
    if (def.cumulative) return branchUnlocked(def);
    return def.levels[bp.current_level].symbols;
}

std::vector<Symbol> SkillTree::unlockedSymbols(const Scope& scope) const {
    std::vector<Symbol> result;
    std::unordered_set<Symbol> seen;

    if (scope.isGlobal()) {
        for (const auto& def : definition_.branches) {
            appendUnique(result, seen, branchUnlocked(def));
        }
        return result;
    }

    const BranchDefinition& target = requireBranch(*scope.branch);
    if (target.id != definition_.root_branch) {
        appendUnique(result, seen, branchUnlocked(requireBranch(definition_.root_branch)));
    }
    appendUnique(result, seen, branchUnlocked(target));
    return result;
}

std::unordered_set<Symbol> SkillTree::unlockedSet(const Scope& scope) const {
    std::vector<Symbol> symbols = unlockedSymbols(scope);
    return std::unordered_set<Symbol>(symbols.begin(), symbols.end());
}

// ── Focus ──

std::optional<Symbol> SkillTree::weakest(const std::vector<Symbol>& candidates,
                                         const SymbolStatsStore& stats) {
    std::optional<Symbol> best;
    double best_confidence = 0.0;
    for (Symbol s : candidates) {
        double c = stats.confidence(s);
        if (c >= 1.0) continue;
        if (!best.has_value() || c < best_confidence) {
            best = s;
            best_confidence = c;
        }
    }
    return best;
}

std::optional<Symbol> SkillTree::focusedSymbol(const Scope& scope,
                                               const SymbolStatsStore& stats) const {
    if (!scope.isGlobal()) {
        return weakest(focusCandidates(requireBranch(*scope.branch)), stats);
    }

    std::vector<Symbol> candidates;
    std::unordered_set<Symbol> seen;
    for (const auto& def : definition_.branches) {
        const BranchProgress& bp = progress_.branches.at(def.id);
        if (bp.status == BranchStatus::InProgress) {
            appendUnique(candidates, seen, focusCandidates(def));
        } else if (bp.status == BranchStatus::Complete) {
            // A mastered symbol that regressed may resurface.
            appendUnique(candidates, seen, def.allSymbols());
        }
    }
    return weakest(candidates, stats);
}

// ── Update ──

bool SkillTree::allConfident(const std::vector<Symbol>& symbols, const SymbolStatsStore& stats) {
    return std::all_of(symbols.begin(), symbols.end(),
                       [&](Symbol s) { return stats.confidence(s) >= 1.0; });
}

void SkillTree::advanceBranch(const BranchDefinition& def, const SymbolStatsStore& stats) {
    BranchProgress& bp = progress_.branches.at(def.id);
    const size_t last = def.levels.size() - 1;

    while (bp.status == BranchStatus::InProgress) {
        if (!allConfident(focusCandidates(def), stats)) break;

        if (bp.current_level < last) {
            bp.current_level++;
            spdlog::info("Branch '{}' advanced to level {} ({})",
                         def.id, bp.current_level, def.levels[bp.current_level].name);
            continue;
        }
        if (allConfident(def.allSymbols(), stats)) {
            bp.status = BranchStatus::Complete;
            spdlog::info("Branch '{}' complete", def.id);
        }
        break;
    }
}

SkillTreeChanges SkillTree::update(const SymbolStatsStore& stats) {
    std::unordered_map<std::string, BranchStatus> before;
    for (const auto& [id, bp] : progress_.branches) before[id] = bp.status;
    const size_t unlocked_before = totalUnlockedCount();
    const bool complete_before = allBranchesComplete();

    const BranchDefinition& root = requireBranch(definition_.root_branch);
    advanceBranch(root, stats);

    if (progress_.branches.at(root.id).status == BranchStatus::Complete) {
        for (auto& [id, bp] : progress_.branches) {
            if (bp.status == BranchStatus::Locked) bp.status = BranchStatus::Available;
        }
    }

    for (const auto& def : definition_.branches) {
        if (def.id == root.id) continue;
        advanceBranch(def, stats);
    }

    SkillTreeChanges changes;
    for (const auto& def : definition_.branches) {
        BranchStatus was = before[def.id];
        BranchStatus now = progress_.branches.at(def.id).status;
        if (was == now) continue;
        if (now == BranchStatus::Available) changes.newly_available.push_back(def.id);
        if (now == BranchStatus::Complete) changes.newly_completed.push_back(def.id);
    }
    changes.all_symbols_unlocked =
        unlocked_before < total_unique_symbols_ && totalUnlockedCount() == total_unique_symbols_;
    changes.all_branches_complete = !complete_before && allBranchesComplete();

    if (!changes.newly_available.empty()) {
        spdlog::info("{} branch(es) now available", changes.newly_available.size());
    }
    return changes;
}

// ── Counts ──

size_t SkillTree::totalUnlockedCount() const {
    return unlockedSymbols(Scope::global()).size();
}

size_t SkillTree::branchTotalSymbols(const std::string& id) const {
    const BranchDefinition& def = requireBranch(id);
    size_t total = 0;
    for (const auto& level : def.levels) total += level.symbols.size();
    return total;
}

size_t SkillTree::branchConfidentSymbols(const std::string& id, const SymbolStatsStore& stats) const {
    const BranchDefinition& def = requireBranch(id);
    size_t confident = 0;
    for (const auto& level : def.levels) {
        for (Symbol s : level.symbols) {
            if (stats.confidence(s) >= 1.0) confident++;
        }
    }
    return confident;
}

double SkillTree::complexity() const {
    if (total_unique_symbols_ == 0) return 0.1;
    double ratio = static_cast<double>(totalUnlockedCount()) / total_unique_symbols_;
    return std::max(ratio, 0.1);
}

bool SkillTree::allBranchesComplete() const {
    for (const auto& [id, bp] : progress_.branches) {
        if (bp.status != BranchStatus::Complete) return false;
    }
    return true;
}

} // namespace keydr
