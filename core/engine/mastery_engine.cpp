#include "engine/mastery_engine.hpp"
#include "tree/default_branches.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <unordered_set>

namespace keydr {

SessionSummary SessionRecord::summary() const {
    SessionSummary s;
    for (const auto& kt : keystrokes) {
        s.elapsed_ms += kt.time_ms;
        if (symbols::isCorrectionMarker(kt.symbol)) continue;
        s.total_chars++;
        if (!kt.correct) s.incorrect++;
    }
    if (s.elapsed_ms > 0.0) {
        s.cpm = static_cast<double>(s.total_chars) / (s.elapsed_ms / 60000.0);
    }
    return s;
}

MasteryEngine::MasteryEngine(EngineConfig config)
    : MasteryEngine(config, defaultSkillTreeDefinition()) {}

MasteryEngine::MasteryEngine(EngineConfig config, SkillTreeDefinition definition)
    : config_(config),
      symbol_stats_(config.targetCpm(), config.ema_alpha),
      bigram_stats_(2, config.targetCpm(), config.ema_alpha, config.anomalyThresholds()),
      trigram_stats_(3, config.targetCpm(), config.ema_alpha, config.anomalyThresholds()),
      tree_(std::move(definition)) {
    config_.validate();
}

void MasteryEngine::restore(const SymbolStatsStore& symbol_stats,
                            const SkillTreeProgress& progress,
                            const ProfileCounters& profile) {
    symbol_stats_ = symbol_stats;
    symbol_stats_.setTargetCpm(config_.targetCpm());
    tree_ = SkillTree(tree_.definition(), progress);
    profile_ = profile;
    bigram_stats_.clear();
    trigram_stats_.clear();
    recent_times_.clear();
    pending_starts_.clear();
    session_index_ = 0;
}

void MasteryEngine::reset() {
    symbol_stats_ = SymbolStatsStore(config_.targetCpm(), config_.ema_alpha);
    bigram_stats_.clear();
    trigram_stats_.clear();
    tree_ = SkillTree(tree_.definition());
    profile_ = ProfileCounters{};
    recent_times_.clear();
    pending_starts_.clear();
    session_index_ = 0;
}

double MasteryEngine::currentHesitationThreshold() const {
    std::vector<double> window(recent_times_.begin(), recent_times_.end());
    return hesitationThreshold(computeMedian(std::move(window)),
                               config_.hesitation_floor_ms,
                               config_.hesitation_multiplier);
}

double MasteryEngine::trigramMarginalGain() const {
    return trigram_stats_.marginalGain(symbol_stats_, &bigram_stats_);
}

void MasteryEngine::updateSymbolStats(const std::vector<KeyTime>& keystrokes) {
    for (const auto& kt : keystrokes) {
        if (kt.correct) {
            symbol_stats_.updateCorrect(kt.symbol, kt.time_ms);
        } else {
            symbol_stats_.updateError(kt.symbol);
        }
    }
}

void MasteryEngine::applyPairEvents(const PairEvents& events, uint32_t session_index) {
    std::vector<PairKey> seen_bigrams;
    std::unordered_set<PairKey, PairKeyHash> bigram_set;
    for (const auto& ev : events.bigrams) {
        bigram_stats_.update(ev.key, ev.time_ms, ev.correct, ev.hesitation, session_index);
        if (bigram_set.insert(ev.key).second) seen_bigrams.push_back(ev.key);
    }

    std::vector<PairKey> seen_trigrams;
    std::unordered_set<PairKey, PairKeyHash> trigram_set;
    for (const auto& ev : events.trigrams) {
        trigram_stats_.update(ev.key, ev.time_ms, ev.correct, ev.hesitation, session_index);
        if (trigram_set.insert(ev.key).second) seen_trigrams.push_back(ev.key);
    }

    // One stability check per pair per session
    for (const auto& key : seen_bigrams) {
        bigram_stats_.updateAnomalyStreaks(key, symbol_stats_);
    }
    for (const auto& key : seen_trigrams) {
        trigram_stats_.updateAnomalyStreaks(key, symbol_stats_, &bigram_stats_);
    }
}

void MasteryEngine::recordTimes(const std::vector<KeyTime>& keystrokes) {
    for (const auto& kt : keystrokes) {
        if (symbols::isCorrectionMarker(kt.symbol)) continue;
        recent_times_.push_back(kt.time_ms);
    }
    while (recent_times_.size() > config_.median_window) {
        recent_times_.pop_front();
    }
}

std::vector<std::string> MasteryEngine::applyBranchStarts(const SessionRecord& session) {
    std::vector<std::string> started = std::move(pending_starts_);
    pending_starts_.clear();
    for (const auto& id : session.started_branches) {
        if (std::find(started.begin(), started.end(), id) != started.end()) continue;
        if (tree_.definition().find(id) == nullptr) {
            // Logged ids can outlive a branch in the tree definition
            spdlog::warn("Ignoring start of unknown branch '{}' in session {}", id, session_index_);
            continue;
        }
        tree_.startBranch(id);
        started.push_back(id);
    }
    return started;
}

SessionOutcome MasteryEngine::processSession(const SessionRecord& session) {
    SessionOutcome outcome;
    outcome.session_index = session_index_;
    outcome.started_branches = applyBranchStarts(session);
    outcome.hesitation_threshold_ms = currentHesitationThreshold();

    if (session.ranked) {
        updateSymbolStats(session.keystrokes);
    }

    PairEvents events = extractPairEvents(session.keystrokes, outcome.hesitation_threshold_ms);
    outcome.bigram_events = events.bigrams.size();
    outcome.trigram_events = events.trigrams.size();
    applyPairEvents(events, session_index_);
    recordTimes(session.keystrokes);

    session_index_++;
    if (trigram_stats_.count() > config_.max_trigrams) {
        outcome.pruned_trigrams = trigram_stats_.prune(
            config_.max_trigrams, session_index_, symbol_stats_, &bigram_stats_);
    }

    outcome.changes = tree_.update(symbol_stats_);

    profile_.total_sessions++;
    if (session.ranked) {
        outcome.score = computeScore(session.summary(), tree_.complexity());
        profile_.total_score += outcome.score;
    }

    spdlog::debug("Session {} processed: {} keystrokes, {} bigrams, {} trigrams, threshold {:.1f}ms",
                  outcome.session_index, session.keystrokes.size(),
                  outcome.bigram_events, outcome.trigram_events,
                  outcome.hesitation_threshold_ms);
    return outcome;
}

void MasteryEngine::replay(const std::vector<SessionRecord>& history) {
    reset();
    for (const auto& session : history) {
        processSession(session);
    }
    spdlog::info("Replayed {} sessions", history.size());
}

void MasteryEngine::rebuildPairStats(const std::vector<SessionRecord>& history) {
    // Streaks depend on the symbol stats of their time, so the symbol
    // side is replayed alongside and then discarded.
    MasteryEngine scratch(config_, tree_.definition());
    for (const auto& session : history) {
        scratch.processSession(session);
    }
    bigram_stats_ = std::move(scratch.bigram_stats_);
    trigram_stats_ = std::move(scratch.trigram_stats_);
    recent_times_ = std::move(scratch.recent_times_);
    session_index_ = scratch.session_index_;
    spdlog::info("Rebuilt pair stats from {} sessions: {} bigrams, {} trigrams",
                 history.size(), bigram_stats_.count(), trigram_stats_.count());
}

FocusSelection MasteryEngine::selectFocus(const Scope& scope) const {
    return keydr::selectFocus(tree_, scope, symbol_stats_, bigram_stats_);
}

bool MasteryEngine::startBranch(const std::string& id) {
    if (!tree_.startBranch(id)) return false;
    pending_starts_.push_back(id);
    return true;
}

} // namespace keydr
