#include "fpl_core/constraints.hpp"

#include <fmt/format.h>

namespace fpl_core {

SquadConstraintSet build_constraints(const LeagueRules &rules) {
  if (rules.squad_size != 15) {
    throw InvalidConfigurationError(fmt::format(
        "build_constraints: squad size must be 15, got {}", rules.squad_size));
  }
  if (rules.budget < 0) {
    throw InvalidConfigurationError(fmt::format(
        "build_constraints: budget must be non-negative, got {}",
        rules.budget));
  }
  if (rules.max_per_club < 1) {
    throw InvalidConfigurationError(fmt::format(
        "build_constraints: max_per_club must be at least 1, got {}",
        rules.max_per_club));
  }

  SquadConstraintSet cons;
  cons.budget = rules.budget;
  cons.squad_size = rules.squad_size;
  cons.max_per_club = rules.max_per_club;
  cons.position_quota = Eigen::ArrayXi::Zero(kNumPositions);
  for (const auto &kv : rules.position_quotas) {
    if (kv.second < 0) {
      throw InvalidConfigurationError(
          fmt::format("build_constraints: quota for {} is negative ({})",
                      position_code(kv.first), kv.second));
    }
    cons.position_quota[position_index(kv.first)] = kv.second;
  }
  const int total = cons.position_quota.sum();
  if (total != cons.squad_size) {
    throw InvalidConfigurationError(
        fmt::format("build_constraints: quotas sum to {}, expected {}", total,
                    cons.squad_size));
  }
  return cons;
}

void check_constraints(const SquadConstraintSet &cons) {
  if (cons.position_quota.size() != kNumPositions) {
    throw InvalidConfigurationError(fmt::format(
        "check_constraints: expected {} position quotas, got {}",
        kNumPositions, cons.position_quota.size()));
  }
  if ((cons.position_quota < 0).any()) {
    throw InvalidConfigurationError(
        "check_constraints: position quotas must be non-negative");
  }
  if (cons.position_quota.sum() != cons.squad_size || cons.squad_size != 15) {
    throw InvalidConfigurationError(fmt::format(
        "check_constraints: quotas sum to {} for a squad of {}, expected 15",
        cons.position_quota.sum(), cons.squad_size));
  }
  if (cons.budget < 0 || cons.max_per_club < 1) {
    throw InvalidConfigurationError(
        "check_constraints: budget must be >= 0 and max_per_club >= 1");
  }
}

void check_formation_rule(const FormationRule &rule) {
  int min_total = 0;
  int max_total = 0;
  for (int i = 0; i < kNumPositions; ++i) {
    const int lo = rule.min_by_pos[i];
    const int hi = rule.max_by_pos[i];
    if (lo < 0 || hi < lo) {
      throw InvalidConfigurationError(fmt::format(
          "check_formation_rule: bad range [{}, {}] for {}", lo, hi,
          position_code(position_from_index(i))));
    }
    min_total += lo;
    max_total += hi;
  }
  if (rule.starters < min_total || rule.starters > max_total) {
    throw InvalidConfigurationError(fmt::format(
        "check_formation_rule: {} starters outside reachable range [{}, {}]",
        rule.starters, min_total, max_total));
  }
}

} // namespace fpl_core
