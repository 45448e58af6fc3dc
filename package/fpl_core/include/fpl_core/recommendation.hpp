#pragma once

#include <string>
#include <vector>

#include "fpl_core/chips.hpp"
#include "fpl_core/constraints.hpp"
#include "fpl_core/lineup.hpp"
#include "fpl_core/optimizer.hpp"
#include "fpl_core/squad.hpp"

namespace fpl_core {

struct RecommendationConfig {
  OptimizerConfig optimizer{};
  LineupConfig lineup{};
  ChipConfig chips{};
};

// Everything the presentation layer renders for one gameweek.
struct Recommendation {
  int gameweek{0};
  Squad squad;
  Lineup lineup;
  std::vector<ChipRecommendation> chips;
  double predicted_points{0.0};
  Money total_cost{0};
  std::string total_cost_label; // e.g. "£95.0m"
  SearchStats search{};
};

// "£95.0m" for 950.
std::string format_cost(Money cost);

// Builds the constraint set from `rules`, optimizes the squad, picks the
// lineup and evaluates chips. Errors from every stage propagate unchanged.
Recommendation recommend(const std::vector<Player> &players,
                         const LeagueRules &rules, const GameweekContext &ctx,
                         const RecommendationConfig &cfg = {});

} // namespace fpl_core
