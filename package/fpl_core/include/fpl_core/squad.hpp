#pragma once

#include <vector>

#include "fpl_core/constraints.hpp"
#include "fpl_core/player.hpp"

namespace fpl_core {

// Fifteen distinct players satisfying a SquadConstraintSet, sorted by
// (position, id). Immutable once built.
class Squad {
public:
  // Validates every squad invariant against `cons` and throws
  // InvalidInputError on the first violation.
  static Squad from_players(std::vector<Player> players,
                            const SquadConstraintSet &cons);

  const std::vector<Player> &players() const { return players_; }
  std::size_t size() const { return players_.size(); }

  Money total_cost() const { return total_cost_; }
  double total_predicted_points() const { return total_predicted_; }

  // Player count per position, indexed by position_index().
  Eigen::ArrayXi count_by_position() const;

  bool contains(std::int64_t id) const;

private:
  explicit Squad(std::vector<Player> players);

  std::vector<Player> players_;
  Money total_cost_{0};
  double total_predicted_{0.0};
};

} // namespace fpl_core
