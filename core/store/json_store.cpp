#include "store/json_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace keydr {

namespace {

const char* kSymbolStatsFile = "symbol_stats.json";
const char* kProfileFile = "profile.json";
const char* kSessionLogFile = "session_log.json";

void checkSchema(const Json::Value& root, const std::string& name) {
    if (!root.isObject() || !root["schema_version"].isUInt() ||
        root["schema_version"].asUInt() != kSchemaVersion) {
        throw std::runtime_error("Unsupported schema in " + name);
    }
}

Json::Value timesToJson(const std::vector<double>& times) {
    Json::Value arr(Json::arrayValue);
    for (double t : times) arr.append(t);
    return arr;
}

// ── Typed field access ──
// Every field read from a store file is type-checked here. A mismatch is
// a corrupt file, never a Json::LogicError or std::invalid_argument.

[[noreturn]] void corrupt(const std::string& source, const std::string& what) {
    throw std::runtime_error("Corrupt store file " + source + ": " + what);
}

void requireObject(const Json::Value& value, const std::string& what, const std::string& source) {
    if (!value.isObject()) corrupt(source, what + " must be an object");
}

double readNumber(const Json::Value& obj, const char* key, double fallback, const std::string& source) {
    const Json::Value& v = obj[key];
    if (v.isNull()) return fallback;
    if (!v.isNumeric()) corrupt(source, std::string(key) + " must be a number");
    return v.asDouble();
}

uint64_t readCount(const Json::Value& obj, const char* key, const std::string& source) {
    const Json::Value& v = obj[key];
    if (v.isNull()) return 0;
    if (!v.isUInt64()) corrupt(source, std::string(key) + " must be a non-negative integer");
    return v.asUInt64();
}

bool readFlag(const Json::Value& obj, const char* key, bool fallback, const std::string& source) {
    const Json::Value& v = obj[key];
    if (v.isNull()) return fallback;
    if (!v.isBool()) corrupt(source, std::string(key) + " must be true or false");
    return v.asBool();
}

std::string readString(const Json::Value& value, const std::string& what, const std::string& source) {
    if (!value.isString()) corrupt(source, what + " must be a string");
    return value.asString();
}

/// Member that may be absent; null when it is, otherwise of `type`.
const Json::Value& readContainer(const Json::Value& obj, const char* key, Json::ValueType type,
                                 const std::string& source) {
    const Json::Value& v = obj[key];
    if (v.isNull() || v.type() == type) return v;
    corrupt(source, std::string(key) + (type == Json::arrayValue ? " must be an array" : " must be an object"));
}

Symbol readSymbol(const std::string& text, const std::string& source) {
    try {
        return symbols::fromUtf8(text);
    } catch (const std::invalid_argument& e) {
        corrupt(source, e.what());
    }
}

} // namespace

JsonStore::JsonStore(std::string base_dir) : base_dir_(std::move(base_dir)) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create store directory " + base_dir_ + ": " + ec.message());
    }
}

std::string JsonStore::filePath(const std::string& name) const {
    return (fs::path(base_dir_) / name).string();
}

Json::Value JsonStore::readDocument(const std::string& name) const {
    std::string path = filePath(name);
    if (!fs::exists(path)) return Json::Value();

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("Corrupt store file " + path + ": " + errors);
    }
    checkSchema(root, path);
    return root;
}

void JsonStore::writeDocument(const std::string& name, const Json::Value& root) const {
    std::string path = filePath(name);
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + tmp_path);
        }
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        out << Json::writeString(writer, root);
        out.flush();
        if (!out) {
            throw std::runtime_error("Write failed for " + tmp_path);
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace " + path + ": " + ec.message());
    }
}

// ── Conversions ──

Json::Value JsonStore::toJson(const SymbolStat& stat) {
    Json::Value v(Json::objectValue);
    v["filtered_time_ms"] = stat.filtered_time_ms;
    v["best_time_ms"] = stat.best_time_ms;
    v["confidence"] = stat.confidence;
    v["sample_count"] = static_cast<Json::UInt64>(stat.sample_count);
    v["error_count"] = static_cast<Json::UInt64>(stat.error_count);
    v["total_count"] = static_cast<Json::UInt64>(stat.total_count);
    v["error_rate_ema"] = stat.error_rate_ema;
    v["recent_times"] = timesToJson(stat.recent_times);
    return v;
}

SymbolStat JsonStore::symbolStatFromJson(const Json::Value& value, const std::string& source) {
    requireObject(value, "symbol stat", source);
    SymbolStat stat;
    stat.filtered_time_ms = readNumber(value, "filtered_time_ms", stat.filtered_time_ms, source);
    stat.best_time_ms = readNumber(value, "best_time_ms", stat.best_time_ms, source);
    stat.confidence = readNumber(value, "confidence", stat.confidence, source);
    stat.sample_count = readCount(value, "sample_count", source);
    stat.error_count = readCount(value, "error_count", source);
    stat.total_count = readCount(value, "total_count", source);
    // Older data without an error EMA starts from the neutral prior.
    stat.error_rate_ema = readNumber(value, "error_rate_ema", kNeutralErrorRate, source);
    for (const auto& t : readContainer(value, "recent_times", Json::arrayValue, source)) {
        if (!t.isNumeric()) corrupt(source, "recent_times must hold numbers");
        stat.recent_times.push_back(t.asDouble());
    }
    return stat;
}

Json::Value JsonStore::toJson(const SessionRecord& session) {
    Json::Value v(Json::objectValue);
    v["ranked"] = session.ranked;
    v["partial"] = session.partial;
    Json::Value keys(Json::arrayValue);
    for (const auto& kt : session.keystrokes) {
        Json::Value k(Json::objectValue);
        k["key"] = symbols::toUtf8(kt.symbol);
        k["time_ms"] = kt.time_ms;
        k["correct"] = kt.correct;
        keys.append(k);
    }
    v["keystrokes"] = keys;
    if (!session.started_branches.empty()) {
        Json::Value started(Json::arrayValue);
        for (const auto& id : session.started_branches) started.append(id);
        v["started_branches"] = started;
    }
    return v;
}

SessionRecord JsonStore::sessionFromJson(const Json::Value& value, const std::string& source) {
    requireObject(value, "session", source);
    SessionRecord session;
    session.ranked = readFlag(value, "ranked", true, source);
    session.partial = readFlag(value, "partial", false, source);
    for (const auto& k : readContainer(value, "keystrokes", Json::arrayValue, source)) {
        requireObject(k, "keystroke", source);
        KeyTime kt;
        kt.symbol = readSymbol(readString(k["key"], "key", source), source);
        kt.time_ms = readNumber(k, "time_ms", 0.0, source);
        kt.correct = readFlag(k, "correct", true, source);
        session.keystrokes.push_back(kt);
    }
    for (const auto& id : readContainer(value, "started_branches", Json::arrayValue, source)) {
        session.started_branches.push_back(readString(id, "started branch id", source));
    }
    return session;
}

// ── Symbol stats ──

SymbolStatsStore JsonStore::loadSymbolStats(double target_cpm, double alpha) const {
    SymbolStatsStore store(target_cpm, alpha);
    Json::Value root = readDocument(kSymbolStatsFile);
    if (root.isNull()) return store;

    std::string source = filePath(kSymbolStatsFile);
    const Json::Value& stats = readContainer(root, "stats", Json::objectValue, source);
    for (const auto& key : stats.getMemberNames()) {
        store.insert(readSymbol(key, source), symbolStatFromJson(stats[key], source));
    }
    store.setTargetCpm(target_cpm);
    spdlog::info("Loaded {} symbol stats", store.count());
    return store;
}

void JsonStore::saveSymbolStats(const SymbolStatsStore& stats) const {
    Json::Value root(Json::objectValue);
    root["schema_version"] = kSchemaVersion;
    root["target_cpm"] = stats.targetCpm();
    Json::Value entries(Json::objectValue);
    for (Symbol s : stats.sortedSymbols()) {
        entries[symbols::toUtf8(s)] = toJson(*stats.find(s));
    }
    root["stats"] = entries;
    writeDocument(kSymbolStatsFile, root);
}

// ── Profile ──

ProfileData JsonStore::loadProfile(const SkillTreeDefinition& definition) const {
    ProfileData data;
    data.skill_tree = SkillTreeProgress::initial(definition);
    Json::Value root = readDocument(kProfileFile);
    if (root.isNull()) return data;

    std::string source = filePath(kProfileFile);
    data.counters.total_score = readNumber(root, "total_score", 0.0, source);
    uint64_t sessions = readCount(root, "total_sessions", source);
    if (sessions > std::numeric_limits<uint32_t>::max()) {
        corrupt(source, "total_sessions out of range");
    }
    data.counters.total_sessions = static_cast<uint32_t>(sessions);

    const Json::Value& branches = readContainer(root, "skill_tree", Json::objectValue, source);
    for (const auto& id : branches.getMemberNames()) {
        const Json::Value& entry = branches[id];
        requireObject(entry, "branch '" + id + "'", source);
        auto status = branchStatusFromName(readString(entry["status"], "status of '" + id + "'", source));
        if (!status.has_value()) {
            throw std::runtime_error("Unknown branch status for '" + id + "' in " + source);
        }
        BranchProgress bp;
        bp.status = *status;
        bp.current_level = readCount(entry, "current_level", source);
        data.skill_tree.branches[id] = bp;
    }
    return data;
}

void JsonStore::saveProfile(const SkillTreeProgress& progress, const ProfileCounters& counters) const {
    Json::Value root(Json::objectValue);
    root["schema_version"] = kSchemaVersion;
    root["total_score"] = counters.total_score;
    root["total_sessions"] = counters.total_sessions;
    Json::Value branches(Json::objectValue);
    for (const auto& [id, bp] : progress.branches) {
        Json::Value entry(Json::objectValue);
        entry["status"] = branchStatusName(bp.status);
        entry["current_level"] = static_cast<Json::UInt64>(bp.current_level);
        branches[id] = entry;
    }
    root["skill_tree"] = branches;
    writeDocument(kProfileFile, root);
}

// ── Session log ──

std::vector<SessionRecord> JsonStore::loadSessionLog() const {
    std::vector<SessionRecord> sessions;
    Json::Value root = readDocument(kSessionLogFile);
    if (root.isNull()) return sessions;

    std::string source = filePath(kSessionLogFile);
    for (const auto& s : readContainer(root, "sessions", Json::arrayValue, source)) {
        sessions.push_back(sessionFromJson(s, source));
    }
    return sessions;
}

void JsonStore::saveSessionLog(const std::vector<SessionRecord>& sessions) const {
    size_t start = sessions.size() > kMaxLoggedSessions ? sessions.size() - kMaxLoggedSessions : 0;

    Json::Value root(Json::objectValue);
    root["schema_version"] = kSchemaVersion;
    Json::Value arr(Json::arrayValue);
    for (size_t i = start; i < sessions.size(); i++) {
        arr.append(toJson(sessions[i]));
    }
    root["sessions"] = arr;
    writeDocument(kSessionLogFile, root);
}

void JsonStore::appendSession(const SessionRecord& session) const {
    std::vector<SessionRecord> sessions = loadSessionLog();
    sessions.push_back(session);
    saveSessionLog(sessions);
}

// ── Engine ──

void JsonStore::saveEngine(const MasteryEngine& engine) const {
    saveSymbolStats(engine.symbolStats());
    saveProfile(engine.skillTree().progress(), engine.profile());
    spdlog::info("Saved engine state to {}", base_dir_);
}

void JsonStore::loadEngine(MasteryEngine& engine) const {
    const EngineConfig& config = engine.config();
    SymbolStatsStore stats = loadSymbolStats(config.targetCpm(), config.ema_alpha);
    ProfileData profile = loadProfile(engine.skillTree().definition());
    engine.restore(stats, profile.skill_tree, profile.counters);
    engine.rebuildPairStats(loadSessionLog());
}

} // namespace keydr
