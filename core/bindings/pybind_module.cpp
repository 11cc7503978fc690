// PyBind11 bindings for the pairank core.
// Exposes the comparison store, the ranking engine and their records to
// a Python evaluation loop.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "logging/log.hpp"
#include "ranking/ranking_engine.hpp"
#include "selector/comparison_selector.hpp"
#include "solver/solver.hpp"
#include "store/comparison_store.hpp"

#include <sstream>

namespace py = pybind11;

PYBIND11_MODULE(pairank_bindings, m) {
    m.doc() = "pairank: Bradley-Terry ranking from pairwise judgements";

    // ─── Errors ──
    auto ranking_error = py::register_exception<pairank::RankingError>(m, "RankingError");
    py::register_exception<pairank::InvalidComparisonError>(
        m, "InvalidComparisonError", ranking_error.ptr());
    py::register_exception<pairank::UnknownCandidateError>(
        m, "UnknownCandidateError", ranking_error.ptr());
    py::register_exception<pairank::StoreUnavailableError>(
        m, "StoreUnavailableError", ranking_error.ptr());

    // ── Winner ──
    py::enum_<pairank::Winner>(m, "Winner")
        .value("A",   pairank::Winner::A)
        .value("B",   pairank::Winner::B)
        .value("TIE", pairank::Winner::Tie);

    m.def("parse_winner", &pairank::parseWinner);

    // ── Records ──
    py::class_<pairank::CandidateRecord>(m, "CandidateRecord")
        .def(py::init<>())
        .def_readonly("id",         &pairank::CandidateRecord::id)
        .def_readonly("score",      &pairank::CandidateRecord::score)
        .def_readonly("wins",       &pairank::CandidateRecord::wins)
        .def_readonly("losses",     &pairank::CandidateRecord::losses)
        .def_readonly("ties",       &pairank::CandidateRecord::ties)
        .def_readonly("games",      &pairank::CandidateRecord::games)
        .def_readonly("created_at", &pairank::CandidateRecord::created_at)
        .def_readonly("updated_at", &pairank::CandidateRecord::updated_at)
        .def("win_rate",            &pairank::CandidateRecord::winRate);

    py::class_<pairank::ComparisonRecord>(m, "ComparisonRecord")
        .def(py::init<>())
        .def_readonly("id",          &pairank::ComparisonRecord::id)
        .def_readonly("candidate_a", &pairank::ComparisonRecord::candidate_a)
        .def_readonly("candidate_b", &pairank::ComparisonRecord::candidate_b)
        .def_readonly("winner",      &pairank::ComparisonRecord::winner)
        .def_readonly("reasoning",   &pairank::ComparisonRecord::reasoning)
        .def_readonly("created_at",  &pairank::ComparisonRecord::created_at)
        .def_readonly("score_a_before", &pairank::ComparisonRecord::score_a_before)
        .def_readonly("score_b_before", &pairank::ComparisonRecord::score_b_before)
        .def_readonly("score_a_after",  &pairank::ComparisonRecord::score_a_after)
        .def_readonly("score_b_after",  &pairank::ComparisonRecord::score_b_after)
        .def_property_readonly("score_a_change", &pairank::ComparisonRecord::scoreChangeA)
        .def_property_readonly("score_b_change", &pairank::ComparisonRecord::scoreChangeB);

    py::class_<pairank::ConvergenceWarning>(m, "ConvergenceWarning")
        .def_readonly("iterations", &pairank::ConvergenceWarning::iterations)
        .def_readonly("max_delta",  &pairank::ConvergenceWarning::max_delta)
        .def_readonly("message",    &pairank::ConvergenceWarning::message);

    // ── Configuration ──
    py::class_<pairank::StoreConfig>(m, "StoreConfig")
        .def(py::init<>())
        .def_readwrite("path",            &pairank::StoreConfig::path)
        .def_readwrite("busy_timeout_ms", &pairank::StoreConfig::busy_timeout_ms)
        .def_readwrite("write_ahead_log", &pairank::StoreConfig::write_ahead_log);

    py::class_<pairank::RankingQuery>(m, "RankingQuery")
        .def(py::init<>())
        .def_readwrite("top_n",     &pairank::RankingQuery::top_n)
        .def_readwrite("min_games", &pairank::RankingQuery::min_games);

    py::class_<pairank::SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("tolerance",      &pairank::SolverConfig::tolerance)
        .def_readwrite("max_iterations", &pairank::SolverConfig::max_iterations);

    py::enum_<pairank::SolverKind>(m, "SolverKind")
        .value("AUTO",              pairank::SolverKind::Auto)
        .value("MINORIZE_MAXIMIZE", pairank::SolverKind::MinorizeMaximize)
        .value("OPTIMIZER",         pairank::SolverKind::Optimizer);

    py::class_<pairank::SelectorConfig>(m, "SelectorConfig")
        .def(py::init<>())
        .def_readwrite("skip_compared", &pairank::SelectorConfig::skip_compared);

    py::class_<pairank::OpponentCounts>(m, "OpponentCounts")
        .def(py::init<>())
        .def_readwrite("random",    &pairank::OpponentCounts::random)
        .def_readwrite("quartile",  &pairank::OpponentCounts::quartile)
        .def_readwrite("neighbors", &pairank::OpponentCounts::neighbors)
        .def_static("from_budget",  &pairank::OpponentCounts::fromBudget);

    py::enum_<pairank::SelectionPhase>(m, "SelectionPhase")
        .value("EXPLORATION", pairank::SelectionPhase::Exploration)
        .value("REFINEMENT",  pairank::SelectionPhase::Refinement);

    py::class_<pairank::RankingConfig>(m, "RankingConfig")
        .def(py::init<>())
        .def_readwrite("solver",      &pairank::RankingConfig::solver)
        .def_readwrite("selector",    &pairank::RankingConfig::selector)
        .def_readwrite("solver_kind", &pairank::RankingConfig::solver_kind)
        .def_readwrite("seed",        &pairank::RankingConfig::seed);

    py::class_<pairank::RecomputeReport>(m, "RecomputeReport")
        .def_readonly("comparison_id", &pairank::RecomputeReport::comparison_id)
        .def_readonly("log_version", &pairank::RecomputeReport::log_version)
        .def_readonly("iterations",  &pairank::RecomputeReport::iterations)
        .def_readonly("max_delta",   &pairank::RecomputeReport::max_delta)
        .def_readonly("converged",   &pairank::RecomputeReport::converged)
        .def_readonly("persisted",   &pairank::RecomputeReport::persisted)
        .def_readonly("solver",      &pairank::RecomputeReport::solver)
        .def_readonly("warning",     &pairank::RecomputeReport::warning)
        .def_readonly("error",       &pairank::RecomputeReport::error);

    py::class_<pairank::ExportMetadata>(m, "ExportMetadata")
        .def_readonly("algorithm",         &pairank::ExportMetadata::algorithm)
        .def_readonly("tolerance",         &pairank::ExportMetadata::tolerance)
        .def_readonly("max_iterations",    &pairank::ExportMetadata::max_iterations)
        .def_readonly("total_candidates",  &pairank::ExportMetadata::total_candidates)
        .def_readonly("total_comparisons", &pairank::ExportMetadata::total_comparisons)
        .def_readonly("exported_at",       &pairank::ExportMetadata::exported_at);

    py::class_<pairank::RankingExport>(m, "RankingExport")
        .def_readonly("metadata",    &pairank::RankingExport::metadata)
        .def_readonly("candidates",  &pairank::RankingExport::candidates)
        .def_readonly("comparisons", &pairank::RankingExport::comparisons);

    // ─── ComparisonStore ──
    py::class_<pairank::ComparisonStore>(m, "ComparisonStore")
        .def(py::init<const pairank::StoreConfig&>())
        .def(py::init<const std::string&>(), py::arg("path"))
        .def("register_candidate", &pairank::ComparisonStore::registerCandidate)
        .def("record", &pairank::ComparisonStore::record,
             py::arg("candidate_a"), py::arg("candidate_b"),
             py::arg("winner"), py::arg("reasoning") = "")
        .def("candidate",        &pairank::ComparisonStore::candidate)
        .def("contains",         &pairank::ComparisonStore::contains)
        .def("rankings",         &pairank::ComparisonStore::rankings,
             py::arg("query") = pairank::RankingQuery{})
        .def("history",          &pairank::ComparisonStore::history)
        .def("comparison",       &pairank::ComparisonStore::comparison)
        .def("comparisons",      &pairank::ComparisonStore::comparisons)
        .def("pair_count",       &pairank::ComparisonStore::pairCount)
        .def("candidate_count",  &pairank::ComparisonStore::candidateCount)
        .def("comparison_count", &pairank::ComparisonStore::comparisonCount)
        .def("log_version",      &pairank::ComparisonStore::logVersion)
        .def_property_readonly("path", &pairank::ComparisonStore::path);

    // ─── RankingEngine ──
    // keep_alive<1, 2>: the engine borrows the store.
    py::class_<pairank::RankingEngine>(m, "RankingEngine")
        .def(py::init<pairank::ComparisonStore&, pairank::RankingConfig>(),
             py::arg("store"), py::arg("config") = pairank::RankingConfig{},
             py::keep_alive<1, 2>())
        .def("submit_result",
             py::overload_cast<const std::string&, const std::string&,
                               const std::string&, const std::string&>(
                 &pairank::RankingEngine::submitResult),
             py::arg("candidate_a"), py::arg("candidate_b"),
             py::arg("winner"), py::arg("reasoning") = "")
        .def("submit_result",
             py::overload_cast<const std::string&, const std::string&,
                               pairank::Winner, const std::string&>(
                 &pairank::RankingEngine::submitResult),
             py::arg("candidate_a"), py::arg("candidate_b"),
             py::arg("winner"), py::arg("reasoning") = "")
        .def("next_opponents", &pairank::RankingEngine::nextOpponents,
             py::arg("candidate_id"),
             py::arg("counts") = pairank::OpponentCounts{},
             py::arg("phase") = pairank::SelectionPhase::Exploration)
        .def("get_rankings", &pairank::RankingEngine::getRankings,
             py::arg("query") = pairank::RankingQuery{})
        .def("register_candidate", &pairank::RankingEngine::registerCandidate)
        .def("recompute",          &pairank::RankingEngine::recompute)
        .def("export_scores",      &pairank::RankingEngine::exportScores)
        .def("export_data",        &pairank::RankingEngine::exportData)
        .def("comparison",         &pairank::RankingEngine::comparison)
        .def("stats",              &pairank::RankingEngine::stats)
        .def("history",            &pairank::RankingEngine::history)
        .def("solver_name",        &pairank::RankingEngine::solverName)
        .def("ranking_table", [](const pairank::RankingEngine& self, size_t top_n) {
            std::ostringstream out;
            self.writeRankingTable(out, top_n);
            return out.str();
        }, py::arg("top_n") = 10);

    m.def("optimizer_available", &pairank::optimizerAvailable);

    m.def("set_log_level", [](const std::string& level) {
        pairank::logging::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
