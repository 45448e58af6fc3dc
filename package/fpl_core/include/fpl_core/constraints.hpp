#pragma once

#include <array>
#include <map>

#include <Eigen/Dense>

#include "fpl_core/player.hpp"

namespace fpl_core {

// Season-long league rules: 100.0m budget, 15 players split 2/5/5/3,
// at most 3 from one club.
struct LeagueRules {
  Money budget{1000};
  std::map<Position, int> position_quotas{{Position::Goalkeeper, 2},
                                          {Position::Defender, 5},
                                          {Position::Midfielder, 5},
                                          {Position::Forward, 3}};
  int max_per_club{3};
  int squad_size{15};
};

struct SquadConstraintSet {
  Money budget{0};
  int squad_size{0};
  Eigen::ArrayXi position_quota; // length = kNumPositions
  int max_per_club{0};

  int quota(Position p) const { return position_quota[position_index(p)]; }
};

// Throws InvalidConfigurationError on quotas that do not sum to the squad
// size, negative quotas, a negative budget or a club cap below one.
SquadConstraintSet build_constraints(const LeagueRules &rules = {});

// Re-checks the invariants of a constraint set that may have been assembled
// by hand.
void check_constraints(const SquadConstraintSet &cons);

// Legal starting XI shapes: exactly one goalkeeper, 3-5 DEF, 2-5 MID,
// 1-3 FWD, eleven in total.
struct FormationRule {
  int starters{11};
  std::array<int, kNumPositions> min_by_pos{1, 3, 2, 1};
  std::array<int, kNumPositions> max_by_pos{1, 5, 5, 3};
};

void check_formation_rule(const FormationRule &rule);

} // namespace fpl_core
