#include "fpl_core/chips.hpp"
#include "fpl_core/constraints.hpp"
#include "fpl_core/errors.hpp"
#include "fpl_core/ingest.hpp"
#include "fpl_core/lineup.hpp"
#include "fpl_core/optimizer.hpp"
#include "fpl_core/player.hpp"
#include "fpl_core/recommendation.hpp"
#include "fpl_core/squad.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

NB_MODULE(_fpl_core, m) {
  m.doc() = "Fantasy squad optimization core.";

  // Errors
  nanobind::exception<fpl_core::DataValidationError>(
      m, "DataValidationError", PyExc_ValueError);
  nanobind::exception<fpl_core::DuplicatePlayerError>(
      m, "DuplicatePlayerError", PyExc_ValueError);
  nanobind::exception<fpl_core::InvalidConfigurationError>(
      m, "InvalidConfigurationError", PyExc_ValueError);
  nanobind::exception<fpl_core::InvalidInputError>(m, "InvalidInputError",
                                                   PyExc_ValueError);
  nanobind::exception<fpl_core::InfeasibleError>(m, "InfeasibleError",
                                                 PyExc_RuntimeError);
  nanobind::exception<fpl_core::TimeoutError>(m, "TimeoutError",
                                              PyExc_RuntimeError);
  nanobind::exception<fpl_core::NoValidFormationError>(
      m, "NoValidFormationError", PyExc_RuntimeError);

  // Player
  nanobind::enum_<fpl_core::Position>(m, "Position")
      .value("Goalkeeper", fpl_core::Position::Goalkeeper)
      .value("Defender", fpl_core::Position::Defender)
      .value("Midfielder", fpl_core::Position::Midfielder)
      .value("Forward", fpl_core::Position::Forward);

  nanobind::enum_<fpl_core::Availability>(m, "Availability")
      .value("Available", fpl_core::Availability::Available)
      .value("Doubtful", fpl_core::Availability::Doubtful)
      .value("Unavailable", fpl_core::Availability::Unavailable);

  nanobind::class_<fpl_core::Player>(m, "Player")
      .def(nanobind::init<>())
      .def(nanobind::init<std::int64_t, std::string, fpl_core::Position,
                          std::string, fpl_core::Money, double>())
      .def_rw("id", &fpl_core::Player::id)
      .def_rw("name", &fpl_core::Player::name)
      .def_rw("position", &fpl_core::Player::position)
      .def_rw("club", &fpl_core::Player::club)
      .def_rw("cost", &fpl_core::Player::cost)
      .def_rw("predicted_points", &fpl_core::Player::predicted_points)
      .def_rw("actual_points", &fpl_core::Player::actual_points)
      .def_rw("availability", &fpl_core::Player::availability)
      .def_rw("minutes", &fpl_core::Player::minutes)
      .def("__repr__", [](const fpl_core::Player &p) {
        return fmt::format(
            "Player(id={}, name={}, position={}, club={}, cost={}, "
            "predicted_points={:.2f}, availability={})",
            p.id, p.name, fpl_core::position_code(p.position), p.club,
            fpl_core::format_cost(p.cost), p.predicted_points,
            fpl_core::availability_name(p.availability));
      });

  nanobind::class_<fpl_core::PlayerCatalog>(m, "PlayerCatalog")
      .def(nanobind::init<>())
      .def("add_player", &fpl_core::PlayerCatalog::add_player)
      .def("size", &fpl_core::PlayerCatalog::size)
      .def("has_id", &fpl_core::PlayerCatalog::has_id)
      .def("get_by_id", &fpl_core::PlayerCatalog::get_by_id)
      .def("players", &fpl_core::PlayerCatalog::players);

  // Ingest
  nanobind::class_<fpl_core::RawPlayerRecord>(m, "RawPlayerRecord")
      .def(nanobind::init<>())
      .def_rw("id", &fpl_core::RawPlayerRecord::id)
      .def_rw("web_name", &fpl_core::RawPlayerRecord::web_name)
      .def_rw("name", &fpl_core::RawPlayerRecord::name)
      .def_rw("element_type", &fpl_core::RawPlayerRecord::element_type)
      .def_rw("position", &fpl_core::RawPlayerRecord::position)
      .def_rw("team", &fpl_core::RawPlayerRecord::team)
      .def_rw("team_name", &fpl_core::RawPlayerRecord::team_name)
      .def_rw("now_cost", &fpl_core::RawPlayerRecord::now_cost)
      .def_rw("cost", &fpl_core::RawPlayerRecord::cost)
      .def_rw("predicted_points", &fpl_core::RawPlayerRecord::predicted_points)
      .def_rw("ep_next", &fpl_core::RawPlayerRecord::ep_next)
      .def_rw("form", &fpl_core::RawPlayerRecord::form)
      .def_rw("ict_index", &fpl_core::RawPlayerRecord::ict_index)
      .def_rw("event_points", &fpl_core::RawPlayerRecord::event_points)
      .def_rw("status", &fpl_core::RawPlayerRecord::status)
      .def_rw("minutes", &fpl_core::RawPlayerRecord::minutes);

  nanobind::class_<fpl_core::IngestConfig>(m, "IngestConfig")
      .def(nanobind::init<>())
      .def_rw("w_ep_next", &fpl_core::IngestConfig::w_ep_next)
      .def_rw("w_form", &fpl_core::IngestConfig::w_form)
      .def_rw("w_ict", &fpl_core::IngestConfig::w_ict)
      .def_rw("ict_scale", &fpl_core::IngestConfig::ict_scale)
      .def_rw("clip_derived_at_zero",
              &fpl_core::IngestConfig::clip_derived_at_zero);

  nanobind::class_<fpl_core::EligibilityFilter>(m, "EligibilityFilter")
      .def(nanobind::init<>())
      .def_rw("allow_doubtful", &fpl_core::EligibilityFilter::allow_doubtful)
      .def_rw("min_minutes", &fpl_core::EligibilityFilter::min_minutes);

  m.def("ingest", &fpl_core::ingest, nanobind::arg("records"),
        nanobind::arg("config") = fpl_core::IngestConfig{});
  m.def("eligible_players", &fpl_core::eligible_players,
        nanobind::arg("players"),
        nanobind::arg("filter") = fpl_core::EligibilityFilter{});

  // Constraints
  nanobind::class_<fpl_core::LeagueRules>(m, "LeagueRules")
      .def(nanobind::init<>())
      .def_rw("budget", &fpl_core::LeagueRules::budget)
      .def_rw("position_quotas", &fpl_core::LeagueRules::position_quotas)
      .def_rw("max_per_club", &fpl_core::LeagueRules::max_per_club)
      .def_rw("squad_size", &fpl_core::LeagueRules::squad_size);

  nanobind::class_<fpl_core::SquadConstraintSet>(m, "SquadConstraintSet")
      .def(nanobind::init<>())
      .def_rw("budget", &fpl_core::SquadConstraintSet::budget)
      .def_rw("squad_size", &fpl_core::SquadConstraintSet::squad_size)
      .def_rw("position_quota", &fpl_core::SquadConstraintSet::position_quota)
      .def_rw("max_per_club", &fpl_core::SquadConstraintSet::max_per_club)
      .def("quota", &fpl_core::SquadConstraintSet::quota);

  nanobind::class_<fpl_core::FormationRule>(m, "FormationRule")
      .def(nanobind::init<>())
      .def_rw("starters", &fpl_core::FormationRule::starters)
      .def_rw("min_by_pos", &fpl_core::FormationRule::min_by_pos)
      .def_rw("max_by_pos", &fpl_core::FormationRule::max_by_pos);

  m.def("build_constraints", &fpl_core::build_constraints,
        nanobind::arg("rules") = fpl_core::LeagueRules{});
  m.def("check_formation_rule", &fpl_core::check_formation_rule,
        nanobind::arg("rule"));

  // Squad and optimizer
  nanobind::class_<fpl_core::Squad>(m, "Squad")
      .def_static("from_players", &fpl_core::Squad::from_players,
                  nanobind::arg("players"), nanobind::arg("constraints"))
      .def("players", &fpl_core::Squad::players)
      .def("size", &fpl_core::Squad::size)
      .def("total_cost", &fpl_core::Squad::total_cost)
      .def("total_predicted_points", &fpl_core::Squad::total_predicted_points)
      .def("count_by_position", &fpl_core::Squad::count_by_position)
      .def("contains", &fpl_core::Squad::contains)
      .def("__repr__", [](const fpl_core::Squad &s) {
        return fmt::format("Squad(size={}, cost={}, predicted_points={:.2f})",
                           s.size(), fpl_core::format_cost(s.total_cost()),
                           s.total_predicted_points());
      });

  nanobind::class_<fpl_core::OptimizerConfig>(m, "OptimizerConfig")
      .def(nanobind::init<>())
      .def_rw("points_resolution",
              &fpl_core::OptimizerConfig::points_resolution)
      .def_rw("max_nodes", &fpl_core::OptimizerConfig::max_nodes)
      .def_rw("time_limit", &fpl_core::OptimizerConfig::time_limit)
      .def_rw("bound_iterations", &fpl_core::OptimizerConfig::bound_iterations)
      .def_rw("eligibility", &fpl_core::OptimizerConfig::eligibility)
      .def_rw("prune_dominated", &fpl_core::OptimizerConfig::prune_dominated)
      .def_rw("verbose", &fpl_core::OptimizerConfig::verbose);

  nanobind::class_<fpl_core::SearchStats>(m, "SearchStats")
      .def(nanobind::init<>())
      .def_ro("eligible_players", &fpl_core::SearchStats::eligible_players)
      .def_ro("candidates", &fpl_core::SearchStats::candidates)
      .def_ro("nodes", &fpl_core::SearchStats::nodes)
      .def_ro("bound_iterations", &fpl_core::SearchStats::bound_iterations)
      .def_ro("elapsed_ms", &fpl_core::SearchStats::elapsed_ms)
      .def_ro("relaxation_points", &fpl_core::SearchStats::relaxation_points);

  nanobind::class_<fpl_core::SquadOptimizer>(m, "SquadOptimizer")
      .def(nanobind::init<>())
      .def(nanobind::init<fpl_core::OptimizerConfig>())
      .def("optimize", &fpl_core::SquadOptimizer::optimize,
           nanobind::arg("players"), nanobind::arg("constraints"))
      .def("last_stats", &fpl_core::SquadOptimizer::last_stats);

  m.def("optimize", &fpl_core::optimize, nanobind::arg("players"),
        nanobind::arg("constraints"),
        nanobind::arg("config") = fpl_core::OptimizerConfig{});
  m.attr("MAX_RELAXATION_CELLS") = fpl_core::kMaxRelaxationCells;

  // Lineup
  nanobind::class_<fpl_core::Formation>(m, "Formation")
      .def(nanobind::init<>())
      .def_rw("defenders", &fpl_core::Formation::defenders)
      .def_rw("midfielders", &fpl_core::Formation::midfielders)
      .def_rw("forwards", &fpl_core::Formation::forwards)
      .def("label", &fpl_core::Formation::label);

  nanobind::class_<fpl_core::LineupConfig>(m, "LineupConfig")
      .def(nanobind::init<>())
      .def_rw("formation", &fpl_core::LineupConfig::formation)
      .def_rw("doubtful_factor", &fpl_core::LineupConfig::doubtful_factor)
      .def_rw("unavailable_factor", &fpl_core::LineupConfig::unavailable_factor)
      .def_rw("verbose", &fpl_core::LineupConfig::verbose);

  nanobind::class_<fpl_core::Lineup>(m, "Lineup")
      .def(nanobind::init<>())
      .def_rw("starters", &fpl_core::Lineup::starters)
      .def_rw("bench", &fpl_core::Lineup::bench)
      .def_rw("formation", &fpl_core::Lineup::formation)
      .def_rw("captain_id", &fpl_core::Lineup::captain_id)
      .def_rw("vice_captain_id", &fpl_core::Lineup::vice_captain_id)
      .def_rw("selection_score", &fpl_core::Lineup::selection_score)
      .def("captain", &fpl_core::Lineup::captain)
      .def("vice_captain", &fpl_core::Lineup::vice_captain)
      .def("starters_predicted_points",
           &fpl_core::Lineup::starters_predicted_points)
      .def("bench_predicted_points", &fpl_core::Lineup::bench_predicted_points)
      .def("__repr__", [](const fpl_core::Lineup &l) {
        return fmt::format("Lineup(formation={}, captain_id={}, "
                           "vice_captain_id={})",
                           l.formation.label(), l.captain_id,
                           l.vice_captain_id);
      });

  nanobind::class_<fpl_core::ScoringOptions>(m, "ScoringOptions")
      .def(nanobind::init<>())
      .def_rw("use_actual_points", &fpl_core::ScoringOptions::use_actual_points)
      .def_rw("triple_captain", &fpl_core::ScoringOptions::triple_captain)
      .def_rw("bench_boost", &fpl_core::ScoringOptions::bench_boost);

  m.def("select_lineup", &fpl_core::select_lineup, nanobind::arg("squad"),
        nanobind::arg("config") = fpl_core::LineupConfig{});
  m.def("score_lineup", &fpl_core::score_lineup, nanobind::arg("lineup"),
        nanobind::arg("options") = fpl_core::ScoringOptions{});

  // Chips
  nanobind::enum_<fpl_core::Chip>(m, "Chip")
      .value("TripleCaptain", fpl_core::Chip::TripleCaptain)
      .value("BenchBoost", fpl_core::Chip::BenchBoost)
      .value("FreeHit", fpl_core::Chip::FreeHit);

  nanobind::class_<fpl_core::GameweekContext>(m, "GameweekContext")
      .def(nanobind::init<>())
      .def_rw("gameweek", &fpl_core::GameweekContext::gameweek)
      .def_rw("fixtures_by_club", &fpl_core::GameweekContext::fixtures_by_club)
      .def_rw("available_chips", &fpl_core::GameweekContext::available_chips);

  nanobind::class_<fpl_core::ChipConfig>(m, "ChipConfig")
      .def(nanobind::init<>())
      .def_rw("triple_captain_multiple",
              &fpl_core::ChipConfig::triple_captain_multiple)
      .def_rw("bench_boost_fraction",
              &fpl_core::ChipConfig::bench_boost_fraction)
      .def_rw("free_hit_fraction", &fpl_core::ChipConfig::free_hit_fraction);

  nanobind::class_<fpl_core::ChipRecommendation>(m, "ChipRecommendation")
      .def(nanobind::init<>())
      .def_rw("chip", &fpl_core::ChipRecommendation::chip)
      .def_rw("recommend", &fpl_core::ChipRecommendation::recommend)
      .def_rw("score", &fpl_core::ChipRecommendation::score)
      .def_rw("threshold", &fpl_core::ChipRecommendation::threshold)
      .def_rw("rationale", &fpl_core::ChipRecommendation::rationale)
      .def("__repr__", [](const fpl_core::ChipRecommendation &r) {
        return fmt::format("ChipRecommendation(chip={}, recommend={}, "
                           "score={:.3f})",
                           fpl_core::chip_name(r.chip), r.recommend, r.score);
      });

  m.def("chip_name", &fpl_core::chip_name);
  m.def("evaluate_chips", &fpl_core::evaluate_chips, nanobind::arg("lineup"),
        nanobind::arg("context"),
        nanobind::arg("config") = fpl_core::ChipConfig{});
  m.def("evaluate_triple_captain", &fpl_core::evaluate_triple_captain,
        nanobind::arg("lineup"),
        nanobind::arg("config") = fpl_core::ChipConfig{});
  m.def("evaluate_bench_boost", &fpl_core::evaluate_bench_boost,
        nanobind::arg("lineup"),
        nanobind::arg("config") = fpl_core::ChipConfig{});
  m.def("evaluate_free_hit", &fpl_core::evaluate_free_hit,
        nanobind::arg("lineup"), nanobind::arg("context"),
        nanobind::arg("config") = fpl_core::ChipConfig{});

  // Pipeline
  nanobind::class_<fpl_core::RecommendationConfig>(m, "RecommendationConfig")
      .def(nanobind::init<>())
      .def_rw("optimizer", &fpl_core::RecommendationConfig::optimizer)
      .def_rw("lineup", &fpl_core::RecommendationConfig::lineup)
      .def_rw("chips", &fpl_core::RecommendationConfig::chips);

  nanobind::class_<fpl_core::Recommendation>(m, "Recommendation")
      .def_ro("gameweek", &fpl_core::Recommendation::gameweek)
      .def_ro("squad", &fpl_core::Recommendation::squad)
      .def_ro("lineup", &fpl_core::Recommendation::lineup)
      .def_ro("chips", &fpl_core::Recommendation::chips)
      .def_ro("predicted_points", &fpl_core::Recommendation::predicted_points)
      .def_ro("total_cost", &fpl_core::Recommendation::total_cost)
      .def_ro("total_cost_label", &fpl_core::Recommendation::total_cost_label)
      .def_ro("search", &fpl_core::Recommendation::search);

  m.def("format_cost", &fpl_core::format_cost);
  m.def("recommend", &fpl_core::recommend, nanobind::arg("players"),
        nanobind::arg("rules"), nanobind::arg("context"),
        nanobind::arg("config") = fpl_core::RecommendationConfig{});
}
