#include "fpl_core/recommendation.hpp"

#include <cstdlib>

#include <fmt/format.h>

namespace fpl_core {

std::string format_cost(Money cost) {
  const char *sign = cost < 0 ? "-" : "";
  const int abs_cost = std::abs(cost);
  return fmt::format("{}£{}.{}m", sign, abs_cost / 10, abs_cost % 10);
}

Recommendation recommend(const std::vector<Player> &players,
                         const LeagueRules &rules, const GameweekContext &ctx,
                         const RecommendationConfig &cfg) {
  const SquadConstraintSet cons = build_constraints(rules);

  SquadOptimizer optimizer(cfg.optimizer);
  Squad squad = optimizer.optimize(players, cons);
  Lineup lineup = select_lineup(squad, cfg.lineup);
  std::vector<ChipRecommendation> chips = evaluate_chips(lineup, ctx, cfg.chips);

  const double points = squad.total_predicted_points();
  const Money cost = squad.total_cost();
  if (cfg.optimizer.verbose) {
    fmt::print("[Debug] recommend: gameweek={} predicted_points={:.2f} "
               "cost={} formation={}\n",
               ctx.gameweek, points, format_cost(cost),
               lineup.formation.label());
  }
  return Recommendation{ctx.gameweek,
                        std::move(squad),
                        std::move(lineup),
                        std::move(chips),
                        points,
                        cost,
                        format_cost(cost),
                        optimizer.last_stats()};
}

} // namespace fpl_core
