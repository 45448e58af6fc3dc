// =============================================================================
// constraints_test.cpp
// =============================================================================
// Unit tests for fpl_core::build_constraints, the formation rule checks and
// fpl_core::Squad::from_players.
//
// Validates:
//   - Default league rules produce the 2/5/5/3, 100.0m, 3-per-club set
//   - Inconsistent rules raise InvalidConfigurationError
//   - Squad construction rejects every kind of illegal fifteen
// =============================================================================

#include "fpl_core/constraints.hpp"
#include "fpl_core/errors.hpp"
#include "fpl_core/squad.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using fpl_core::Position;
using fpl_test::makePlayer;

namespace {

// The fifteen cheapest players of the reference catalog (95.0m).
std::vector<fpl_core::Player> cheapestFifteen() {
  const auto all = fpl_test::referenceCatalog();
  // GK 1-2, DEF 3-7, MID 9-13, FWD 16-18
  const std::vector<std::int64_t> ids = {1,  2,  3,  4,  5,  6,  7, 9,
                                         10, 11, 12, 13, 16, 17, 18};
  std::vector<fpl_core::Player> out;
  for (const auto &p : all) {
    if (std::find(ids.begin(), ids.end(), p.id) != ids.end())
      out.push_back(p);
  }
  return out;
}

} // namespace

// -----------------------------------------------------------------------------
// 1. build_constraints()
// -----------------------------------------------------------------------------
TEST(BuildConstraintsTest, DefaultRules) {
  const auto cons = fpl_core::build_constraints();
  EXPECT_EQ(cons.budget, 1000);
  EXPECT_EQ(cons.squad_size, 15);
  EXPECT_EQ(cons.max_per_club, 3);
  ASSERT_EQ(cons.position_quota.size(), fpl_core::kNumPositions);
  EXPECT_EQ(cons.quota(Position::Goalkeeper), 2);
  EXPECT_EQ(cons.quota(Position::Defender), 5);
  EXPECT_EQ(cons.quota(Position::Midfielder), 5);
  EXPECT_EQ(cons.quota(Position::Forward), 3);
  EXPECT_NO_THROW(fpl_core::check_constraints(cons));
}

TEST(BuildConstraintsTest, CustomBudgetAndClubCap) {
  fpl_core::LeagueRules rules;
  rules.budget = 835;
  rules.max_per_club = 2;
  const auto cons = fpl_core::build_constraints(rules);
  EXPECT_EQ(cons.budget, 835);
  EXPECT_EQ(cons.max_per_club, 2);
}

TEST(BuildConstraintsTest, InconsistentRulesRejected) {
  fpl_core::LeagueRules quotas_off;
  quotas_off.position_quotas[Position::Forward] = 4;
  EXPECT_THROW(fpl_core::build_constraints(quotas_off),
               fpl_core::InvalidConfigurationError);

  fpl_core::LeagueRules negative_quota;
  negative_quota.position_quotas[Position::Goalkeeper] = -1;
  negative_quota.position_quotas[Position::Defender] = 8;
  EXPECT_THROW(fpl_core::build_constraints(negative_quota),
               fpl_core::InvalidConfigurationError);

  fpl_core::LeagueRules small_squad;
  small_squad.squad_size = 11;
  EXPECT_THROW(fpl_core::build_constraints(small_squad),
               fpl_core::InvalidConfigurationError);

  fpl_core::LeagueRules negative_budget;
  negative_budget.budget = -1;
  EXPECT_THROW(fpl_core::build_constraints(negative_budget),
               fpl_core::InvalidConfigurationError);

  fpl_core::LeagueRules no_clubs;
  no_clubs.max_per_club = 0;
  EXPECT_THROW(fpl_core::build_constraints(no_clubs),
               fpl_core::InvalidConfigurationError);
}

TEST(BuildConstraintsTest, ZeroBudgetIsAllowed) {
  fpl_core::LeagueRules rules;
  rules.budget = 0;
  EXPECT_EQ(fpl_core::build_constraints(rules).budget, 0);
}

// -----------------------------------------------------------------------------
// 2. Formation rule
// -----------------------------------------------------------------------------
TEST(FormationRuleTest, DefaultRuleIsConsistent) {
  EXPECT_NO_THROW(fpl_core::check_formation_rule(fpl_core::FormationRule{}));
}

TEST(FormationRuleTest, UnreachableStarterCountRejected) {
  fpl_core::FormationRule rule;
  rule.starters = 20;
  EXPECT_THROW(fpl_core::check_formation_rule(rule),
               fpl_core::InvalidConfigurationError);

  fpl_core::FormationRule inverted;
  inverted.min_by_pos[1] = 6;
  EXPECT_THROW(fpl_core::check_formation_rule(inverted),
               fpl_core::InvalidConfigurationError);
}

// -----------------------------------------------------------------------------
// 3. Squad::from_players
// -----------------------------------------------------------------------------
TEST(SquadTest, ValidSquadIsSortedWithTotals) {
  auto players = cheapestFifteen();
  std::reverse(players.begin(), players.end());
  const auto squad =
      fpl_core::Squad::from_players(players, fpl_core::build_constraints());

  EXPECT_EQ(squad.size(), 15u);
  EXPECT_EQ(squad.total_cost(), 950);
  EXPECT_EQ(squad.players().front().id, 1);
  EXPECT_EQ(squad.players().back().id, 18);
  const Eigen::ArrayXi counts = squad.count_by_position();
  EXPECT_EQ(counts[0], 2);
  EXPECT_EQ(counts[1], 5);
  EXPECT_EQ(counts[2], 5);
  EXPECT_EQ(counts[3], 3);
  EXPECT_TRUE(squad.contains(9));
  EXPECT_FALSE(squad.contains(8));

  double pts = 0.0;
  for (const auto &p : players)
    pts += p.predicted_points;
  EXPECT_NEAR(squad.total_predicted_points(), pts, 1e-9);
}

TEST(SquadTest, WrongSizeRejected) {
  auto players = cheapestFifteen();
  players.pop_back();
  EXPECT_THROW(
      fpl_core::Squad::from_players(players, fpl_core::build_constraints()),
      fpl_core::InvalidInputError);
}

TEST(SquadTest, DuplicatePlayerRejected) {
  auto players = cheapestFifteen();
  players[1] = players[0];
  EXPECT_THROW(
      fpl_core::Squad::from_players(players, fpl_core::build_constraints()),
      fpl_core::InvalidInputError);
}

TEST(SquadTest, QuotaViolationRejected) {
  auto players = cheapestFifteen();
  // Swap a forward for a sixth midfielder.
  players.back() = makePlayer(99, Position::Midfielder, "club-99", 50, 5.0);
  EXPECT_THROW(
      fpl_core::Squad::from_players(players, fpl_core::build_constraints()),
      fpl_core::InvalidInputError);
}

TEST(SquadTest, ClubCapViolationRejected) {
  auto players = cheapestFifteen();
  for (int i = 2; i < 6; ++i)
    players[i].club = "Chelsea";
  EXPECT_THROW(
      fpl_core::Squad::from_players(players, fpl_core::build_constraints()),
      fpl_core::InvalidInputError);

  players[5].club = "Fulham";
  EXPECT_NO_THROW(
      fpl_core::Squad::from_players(players, fpl_core::build_constraints()));
}

TEST(SquadTest, OverBudgetRejected) {
  fpl_core::LeagueRules rules;
  rules.budget = 949;
  const auto cons = fpl_core::build_constraints(rules);
  EXPECT_THROW(fpl_core::Squad::from_players(cheapestFifteen(), cons),
               fpl_core::InvalidInputError);
}
