#pragma once

#include "config/engine_config.hpp"
#include "extraction/pair_extraction.hpp"
#include "focus/focus_selector.hpp"
#include "progress/scoring.hpp"
#include "stats/pair_stats.hpp"
#include "stats/symbol_stats.hpp"
#include "tree/skill_tree.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace keydr {

// ─── Session Record ────────────────────────────────────────────
// One finished practice session as delivered by the capture layer.
// This is also the unit of the replayable event log.

struct SessionRecord {
    std::vector<KeyTime> keystrokes;
    bool ranked = true;    // unranked sessions leave symbol stats alone
    bool partial = false;  // ended early; processed the same way

    /// Branches explicitly started before this session. Applied ahead of
    /// the keystrokes so a replayed log reaches the same tree state.
    std::vector<std::string> started_branches;

    /// Aggregate numbers for scoring. Correction markers are excluded
    /// from the character counts but not from the elapsed time.
    SessionSummary summary() const;
};

struct SessionOutcome {
    uint32_t session_index = 0;
    SkillTreeChanges changes;
    double score = 0.0;
    double hesitation_threshold_ms = 0.0;
    size_t bigram_events = 0;
    size_t trigram_events = 0;
    size_t pruned_trigrams = 0;

    /// Every branch start this session accounts for: the record's own
    /// plus those made through startBranch() since the previous session.
    /// Copy into the record before appending it to the session log.
    std::vector<std::string> started_branches;
};

struct ProfileCounters {
    double total_score = 0.0;
    uint32_t total_sessions = 0;
};

// ─── Mastery Engine ────────────────────────────────────────────
// Runs the end-of-session pipeline:
//   keystrokes → symbol stats → pair events → pair stats → anomaly
//   streaks → trigram pruning → skill tree update
// Pair statistics are never persisted; they are rebuilt by replaying
// the session log, so live processing and replay must agree exactly.

class MasteryEngine {
public:
    explicit MasteryEngine(EngineConfig config = {});
    MasteryEngine(EngineConfig config, SkillTreeDefinition definition);

    /// Install persisted state. Pair stats are left empty; call
    /// rebuildPairStats() with the session log afterwards.
    void restore(const SymbolStatsStore& symbol_stats,
                 const SkillTreeProgress& progress,
                 const ProfileCounters& profile);

    /// Fold one finished session into every statistic.
    SessionOutcome processSession(const SessionRecord& session);

    /// Reset to empty state and process every session in order. Branch
    /// starts come from each record's started_branches.
    void replay(const std::vector<SessionRecord>& history);

    /// Rebuild pair stats, the keystroke-time window and the session
    /// index from the log, leaving symbol stats and tree progress as
    /// restored.
    void rebuildPairStats(const std::vector<SessionRecord>& history);

    /// Focus for the next session's text.
    FocusSelection selectFocus(const Scope& scope) const;

    /// Explicit Available → InProgress. A successful start is reported
    /// in the next SessionOutcome's started_branches.
    bool startBranch(const std::string& id);

    /// Threshold the next session will be judged against.
    double currentHesitationThreshold() const;

    /// Share of well-sampled trigrams that carry an error signal beyond
    /// their bigrams. Low values mean trigram tracking adds little.
    double trigramMarginalGain() const;

    /// Drop all statistics and progress.
    void reset();

    const EngineConfig& config() const { return config_; }
    const SymbolStatsStore& symbolStats() const { return symbol_stats_; }
    const PairStatsStore& bigramStats() const { return bigram_stats_; }
    const PairStatsStore& trigramStats() const { return trigram_stats_; }
    const SkillTree& skillTree() const { return tree_; }
    const ProfileCounters& profile() const { return profile_; }
    uint32_t sessionIndex() const { return session_index_; }

private:
    EngineConfig config_;
    SymbolStatsStore symbol_stats_;
    PairStatsStore bigram_stats_;
    PairStatsStore trigram_stats_;
    SkillTree tree_;
    ProfileCounters profile_;
    uint32_t session_index_ = 0;

    // Most recent keystroke times, oldest first.
    std::deque<double> recent_times_;

    // Started since the last processed session, not yet logged.
    std::vector<std::string> pending_starts_;

    void updateSymbolStats(const std::vector<KeyTime>& keystrokes);
    void applyPairEvents(const PairEvents& events, uint32_t session_index);
    void recordTimes(const std::vector<KeyTime>& keystrokes);
    std::vector<std::string> applyBranchStarts(const SessionRecord& session);
};

} // namespace keydr
