#pragma once

#include "engine/mastery_engine.hpp"
#include "stats/symbol_stats.hpp"
#include "tree/skill_tree.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace keydr {

constexpr uint32_t kSchemaVersion = 1;
constexpr size_t kMaxLoggedSessions = 500;

struct ProfileData {
    SkillTreeProgress skill_tree;
    ProfileCounters counters;
};

// ─── JSON Store ────────────────────────────────────────────────
// Durable state lives in three files under one directory:
//   symbol_stats.json   SymbolStatsStore
//   profile.json        skill tree progress + profile counters
//   session_log.json    the last kMaxLoggedSessions sessions, replayed
//                       at startup to rebuild pair statistics
// Writes go through a temporary file and a rename. A missing file loads
// as fresh state; an unreadable or mismatched one throws
// std::runtime_error so saved data is never silently replaced.

class JsonStore {
public:
    /// Creates `base_dir` if needed. Throws std::runtime_error on failure.
    explicit JsonStore(std::string base_dir);

    SymbolStatsStore loadSymbolStats(double target_cpm, double alpha) const;
    void saveSymbolStats(const SymbolStatsStore& stats) const;

    ProfileData loadProfile(const SkillTreeDefinition& definition) const;
    void saveProfile(const SkillTreeProgress& progress, const ProfileCounters& counters) const;

    std::vector<SessionRecord> loadSessionLog() const;

    /// Keeps only the most recent kMaxLoggedSessions.
    void saveSessionLog(const std::vector<SessionRecord>& sessions) const;
    void appendSession(const SessionRecord& session) const;

    /// Persist symbol stats and profile of a running engine.
    void saveEngine(const MasteryEngine& engine) const;

    /// Restore persisted state into `engine` and rebuild its pair stats
    /// from the session log.
    void loadEngine(MasteryEngine& engine) const;

    std::string filePath(const std::string& name) const;

    // ── Conversions ──
    // The readers throw std::runtime_error naming `source` when a field
    // has the wrong type or a symbol key is not a single code point.
    static Json::Value toJson(const SymbolStat& stat);
    static SymbolStat symbolStatFromJson(const Json::Value& value, const std::string& source);
    static Json::Value toJson(const SessionRecord& session);
    static SessionRecord sessionFromJson(const Json::Value& value, const std::string& source);

private:
    std::string base_dir_;

    /// Parsed document, or a null value if the file does not exist.
    Json::Value readDocument(const std::string& name) const;
    void writeDocument(const std::string& name, const Json::Value& root) const;
};

} // namespace keydr
