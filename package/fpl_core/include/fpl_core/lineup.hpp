#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "fpl_core/constraints.hpp"
#include "fpl_core/player.hpp"
#include "fpl_core/squad.hpp"

namespace fpl_core {

struct LineupConfig {
  FormationRule formation{};
  // Starters are ranked on predicted points times these factors.
  double doubtful_factor{0.5};
  double unavailable_factor{0.0};
  bool verbose{false};
};

struct Formation {
  int defenders{0};
  int midfielders{0};
  int forwards{0};

  // e.g. "4-4-2"
  std::string label() const;
};

struct Lineup {
  std::vector<Player> starters; // sorted by (position, id)
  std::vector<Player> bench;    // substitution order, goalkeeper last
  Formation formation{};
  std::int64_t captain_id{0};
  std::int64_t vice_captain_id{0};
  double selection_score{0.0}; // availability-weighted starter points

  const Player &captain() const;
  const Player &vice_captain() const;
  double starters_predicted_points() const;
  double bench_predicted_points() const;
};

// Best starting XI of a squad over every formation the rule allows.
// Captain and vice-captain are the two highest predicted scorers among the
// available starters; unavailable or doubtful starters only take the
// armband when fewer than two starters are available.
// Throws NoValidFormationError when the squad cannot field any formation.
Lineup select_lineup(const Squad &squad, const LineupConfig &cfg = {});

struct ScoringOptions {
  // Score on actual points (0 for players without any); the vice-captain
  // takes the armband when the captain has no actual points.
  bool use_actual_points{false};
  bool triple_captain{false};
  bool bench_boost{false};
};

double score_lineup(const Lineup &lineup, const ScoringOptions &opts = {});

} // namespace fpl_core
