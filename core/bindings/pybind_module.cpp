// PyBind11 bindings for the keydr core.
// Exposes the session pipeline, focus selection and skill tree queries.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/engine_config.hpp"
#include "engine/mastery_engine.hpp"
#include "focus/focus_selector.hpp"
#include "log/logging.hpp"
#include "progress/scoring.hpp"
#include "store/json_store.hpp"
#include "tree/default_branches.hpp"

namespace py = pybind11;

PYBIND11_MODULE(keydr_bindings, m) {
    m.doc() = "keydr adaptive typing engine bindings";

    // ── EngineConfig ──
    py::class_<keydr::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("target_wpm", &keydr::EngineConfig::target_wpm)
        .def_readwrite("ema_alpha", &keydr::EngineConfig::ema_alpha)
        .def_readwrite("error_anomaly_ratio", &keydr::EngineConfig::error_anomaly_ratio)
        .def_readwrite("speed_anomaly_pct", &keydr::EngineConfig::speed_anomaly_pct)
        .def_readwrite("streak_required", &keydr::EngineConfig::streak_required)
        .def_readwrite("min_pair_samples", &keydr::EngineConfig::min_pair_samples)
        .def_readwrite("max_trigrams", &keydr::EngineConfig::max_trigrams)
        .def_readwrite("hesitation_floor_ms", &keydr::EngineConfig::hesitation_floor_ms)
        .def_readwrite("log_level", &keydr::EngineConfig::log_level)
        .def("target_cpm", &keydr::EngineConfig::targetCpm)
        .def("validate", &keydr::EngineConfig::validate);

    m.def("load_config", [](const std::string& path) {
        keydr::EngineConfig config = keydr::loadConfig(path);
        keydr::configureLogging(config.log_level);
        return config;
    }, py::arg("path"));
    m.def("save_config", &keydr::saveConfig, py::arg("path"), py::arg("config"));
    m.def("configure_logging", &keydr::configureLogging, py::arg("level"));

    // ── KeyTime / SessionRecord ──
    py::class_<keydr::KeyTime>(m, "KeyTime")
        .def(py::init<>())
        .def(py::init([](char32_t symbol, double time_ms, bool correct) {
            return keydr::KeyTime{symbol, time_ms, correct};
        }), py::arg("symbol"), py::arg("time_ms"), py::arg("correct") = true)
        .def_readwrite("symbol", &keydr::KeyTime::symbol)
        .def_readwrite("time_ms", &keydr::KeyTime::time_ms)
        .def_readwrite("correct", &keydr::KeyTime::correct);

    py::class_<keydr::SessionRecord>(m, "SessionRecord")
        .def(py::init<>())
        .def_readwrite("keystrokes", &keydr::SessionRecord::keystrokes)
        .def_readwrite("ranked", &keydr::SessionRecord::ranked)
        .def_readwrite("partial", &keydr::SessionRecord::partial)
        .def_readwrite("started_branches", &keydr::SessionRecord::started_branches);

    // ── Anomalies and focus ──
    py::enum_<keydr::AnomalyKind>(m, "AnomalyKind")
        .value("Error", keydr::AnomalyKind::Error)
        .value("Speed", keydr::AnomalyKind::Speed);

    py::class_<keydr::PairAnomaly>(m, "PairAnomaly")
        .def_property_readonly("pair", [](const keydr::PairAnomaly& a) { return a.key.toString(); })
        .def_readonly("anomaly_pct", &keydr::PairAnomaly::anomaly_pct)
        .def_readonly("kind", &keydr::PairAnomaly::kind);

    py::class_<keydr::FocusSelection>(m, "FocusSelection")
        .def_readonly("char_focus", &keydr::FocusSelection::char_focus)
        .def_readonly("pair_focus", &keydr::FocusSelection::pair_focus);

    py::class_<keydr::Scope>(m, "Scope")
        .def_static("global_scope", &keydr::Scope::global)
        .def_static("for_branch", &keydr::Scope::forBranch, py::arg("branch_id"))
        .def("is_global", &keydr::Scope::isGlobal);

    // ── Skill tree ──
    py::enum_<keydr::BranchStatus>(m, "BranchStatus")
        .value("Locked", keydr::BranchStatus::Locked)
        .value("Available", keydr::BranchStatus::Available)
        .value("InProgress", keydr::BranchStatus::InProgress)
        .value("Complete", keydr::BranchStatus::Complete);

    py::class_<keydr::SkillTreeChanges>(m, "SkillTreeChanges")
        .def_readonly("newly_available", &keydr::SkillTreeChanges::newly_available)
        .def_readonly("newly_completed", &keydr::SkillTreeChanges::newly_completed)
        .def_readonly("all_symbols_unlocked", &keydr::SkillTreeChanges::all_symbols_unlocked)
        .def_readonly("all_branches_complete", &keydr::SkillTreeChanges::all_branches_complete);

    py::class_<keydr::SessionOutcome>(m, "SessionOutcome")
        .def_readonly("session_index", &keydr::SessionOutcome::session_index)
        .def_readonly("changes", &keydr::SessionOutcome::changes)
        .def_readonly("score", &keydr::SessionOutcome::score)
        .def_readonly("hesitation_threshold_ms", &keydr::SessionOutcome::hesitation_threshold_ms)
        .def_readonly("started_branches", &keydr::SessionOutcome::started_branches);

    // ── MasteryEngine ──
    py::class_<keydr::MasteryEngine>(m, "MasteryEngine")
        .def(py::init<keydr::EngineConfig>(), py::arg("config") = keydr::EngineConfig{})
        .def("process_session", &keydr::MasteryEngine::processSession, py::arg("session"))
        .def("replay", &keydr::MasteryEngine::replay, py::arg("history"))
        .def("select_focus", &keydr::MasteryEngine::selectFocus, py::arg("scope"))
        .def("start_branch", &keydr::MasteryEngine::startBranch, py::arg("branch_id"))
        .def("reset", &keydr::MasteryEngine::reset)
        .def("branch_status", [](const keydr::MasteryEngine& self, const std::string& id) {
            return self.skillTree().branchStatus(id);
        }, py::arg("branch_id"))
        .def("unlocked_symbols", [](const keydr::MasteryEngine& self, const keydr::Scope& scope) {
            return self.skillTree().unlockedSymbols(scope);
        }, py::arg("scope"))
        .def("confidence", [](const keydr::MasteryEngine& self, char32_t symbol) {
            return self.symbolStats().confidence(symbol);
        }, py::arg("symbol"))
        .def("total_score", [](const keydr::MasteryEngine& self) {
            return self.profile().total_score;
        })
        .def("level", [](const keydr::MasteryEngine& self) {
            return keydr::levelFromScore(self.profile().total_score);
        });

    // ── Persistence ──
    py::class_<keydr::JsonStore>(m, "JsonStore")
        .def(py::init<std::string>(), py::arg("base_dir"))
        .def("save_engine", &keydr::JsonStore::saveEngine, py::arg("engine"))
        .def("load_engine", &keydr::JsonStore::loadEngine, py::arg("engine"))
        .def("append_session", &keydr::JsonStore::appendSession, py::arg("session"));

    m.def("default_branch_ids", []() {
        std::vector<std::string> ids;
        for (const auto& branch : keydr::defaultSkillTreeDefinition().branches) {
            ids.push_back(branch.id);
        }
        return ids;
    });
}
