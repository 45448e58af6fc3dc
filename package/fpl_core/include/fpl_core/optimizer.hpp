#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "fpl_core/constraints.hpp"
#include "fpl_core/ingest.hpp"
#include "fpl_core/player.hpp"
#include "fpl_core/squad.hpp"

namespace fpl_core {

// Largest bound table, in cells of (candidate, remaining quota, budget),
// the optimizer will allocate. Bigger problems raise InvalidInputError.
constexpr std::int64_t kMaxRelaxationCells = std::int64_t{1} << 26;

struct OptimizerConfig {
  // Predicted points are compared on this integer grid (1000 = 0.001 pts).
  double points_resolution{1000.0};
  // Search budget. Expiry before optimality is proven raises TimeoutError.
  // The clock also runs while the bound tables are built.
  std::optional<std::uint64_t> max_nodes;
  std::optional<std::chrono::milliseconds> time_limit{
      std::chrono::milliseconds(60000)};
  // Subgradient steps spent on the per-club multipliers of the bound.
  // 0 bounds with club caps dropped entirely.
  int bound_iterations{60};
  EligibilityFilter eligibility{};
  // Drop players that some same-position rival always beats before
  // searching. Never changes the result.
  bool prune_dominated{true};
  bool verbose{false};
};

struct SearchStats {
  int eligible_players{0};
  int candidates{0}; // left after dominance pruning
  std::uint64_t nodes{0};
  int bound_iterations{0};
  double elapsed_ms{0.0};
  // Root bound after the multiplier steps; an upper bound on the squad's
  // predicted points.
  double relaxation_points{0.0};
};

// Exact 0/1 selection of a squad: maximize predicted points, then minimize
// cost, then prefer the lowest identifiers in (position, id) order.
//
// Branch-and-bound over one binary decision per eligible player. Each node
// is bounded by a Lagrangian relaxation of the club caps: every club carries
// a multiplier charged on its players and credited on its unused slots, and
// the rest is solved exactly by a knapsack-style table over (player suffix,
// remaining quota, budget). The multipliers are tuned by subgradient steps
// at the root, whose repaired relaxed squads seed the incumbent.
class SquadOptimizer {
public:
  SquadOptimizer() = default;
  explicit SquadOptimizer(OptimizerConfig cfg) : cfg_(std::move(cfg)) {}

  // Throws InvalidInputError, InvalidConfigurationError, InfeasibleError or
  // TimeoutError; never returns a squad that is not provably optimal.
  Squad optimize(const std::vector<Player> &players,
                 const SquadConstraintSet &cons);

  const SearchStats &last_stats() const { return stats_; }
  const OptimizerConfig &config() const { return cfg_; }

private:
  OptimizerConfig cfg_{};
  SearchStats stats_{};
};

Squad optimize(const std::vector<Player> &players,
               const SquadConstraintSet &cons,
               const OptimizerConfig &cfg = {});

} // namespace fpl_core
