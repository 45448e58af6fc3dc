// =============================================================================
// lineup_test.cpp
// =============================================================================
// Unit tests for fpl_core::select_lineup and fpl_core::score_lineup.
//
// Validates:
//   - The XI is the best legal formation on availability-weighted points
//   - Formation ties resolve to the first shape in enumeration order
//   - Bench order and armband choice
//   - Scoring with captain, Triple Captain, Bench Boost and actual points
// =============================================================================

#include "fpl_core/errors.hpp"
#include "fpl_core/lineup.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using fpl_core::Availability;

namespace {

// ids: GK 1-2, DEF 3-7, MID 8-12, FWD 13-15
const std::vector<double> kPoints = {5, 2,          // GK
                                     6, 5, 4, 3, 2, // DEF
                                     9, 8, 7, 1, 1, // MID
                                     8, 7, 1};      // FWD

std::vector<std::int64_t> ids(const std::vector<fpl_core::Player> &players) {
  std::vector<std::int64_t> out;
  for (const auto &p : players)
    out.push_back(p.id);
  return out;
}

bool starts(const fpl_core::Lineup &lineup, std::int64_t id) {
  for (const auto &p : lineup.starters) {
    if (p.id == id)
      return true;
  }
  return false;
}

} // namespace

// -----------------------------------------------------------------------------
// 1. Formation and starters
// -----------------------------------------------------------------------------
TEST(SelectLineupTest, PicksHighestScoringFormation) {
  const auto squad = fpl_test::squadWithPoints(kPoints);
  const auto lineup = fpl_core::select_lineup(squad);

  EXPECT_EQ(lineup.formation.label(), "5-3-2");
  ASSERT_EQ(lineup.starters.size(), 11u);
  ASSERT_EQ(lineup.bench.size(), 4u);
  const std::vector<std::int64_t> expected_xi = {1, 3,  4,  5, 6, 7,
                                                 8, 9, 10, 13, 14};
  EXPECT_EQ(ids(lineup.starters), expected_xi);
  EXPECT_DOUBLE_EQ(lineup.starters_predicted_points(), 64.0);
  EXPECT_DOUBLE_EQ(lineup.selection_score, 64.0);
}

TEST(SelectLineupTest, BenchOrderedByPointsWithKeeperLast) {
  const auto squad = fpl_test::squadWithPoints(kPoints);
  const auto lineup = fpl_core::select_lineup(squad);

  // Outfield bench players tie on 1 point and fall back to id.
  const std::vector<std::int64_t> expected_bench = {11, 12, 15, 2};
  EXPECT_EQ(ids(lineup.bench), expected_bench);
  EXPECT_DOUBLE_EQ(lineup.bench_predicted_points(), 5.0);
}

TEST(SelectLineupTest, CaptainAndViceAreTopScorers) {
  const auto lineup =
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints));
  EXPECT_EQ(lineup.captain_id, 8);
  // Ids 9 and 13 both predict 8; the lower id wins.
  EXPECT_EQ(lineup.vice_captain_id, 9);
  EXPECT_EQ(lineup.captain().id, 8);
  EXPECT_EQ(lineup.vice_captain().id, 9);
}

TEST(SelectLineupTest, FormationTieGoesToFirstEnumerated) {
  const auto squad = fpl_test::squadWithPoints(std::vector<double>(15, 5.0));
  const auto lineup = fpl_core::select_lineup(squad);
  // 3-4-3 is the first legal shape with the fewest defenders.
  EXPECT_EQ(lineup.formation.label(), "3-4-3");
  EXPECT_DOUBLE_EQ(lineup.selection_score, 55.0);
}

// -----------------------------------------------------------------------------
// 2. Availability
// -----------------------------------------------------------------------------
TEST(SelectLineupTest, UnavailablePlayerDropsToBench) {
  std::vector<Availability> avail(15, Availability::Available);
  avail[7] = Availability::Unavailable; // id 8, the 9-point midfielder
  const auto lineup =
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints, avail));

  EXPECT_FALSE(starts(lineup, 8));
  EXPECT_NE(lineup.captain_id, 8);
  EXPECT_EQ(lineup.captain_id, 9);
  EXPECT_EQ(lineup.vice_captain_id, 13);
  // 5-2-3 and 5-3-2 both score 56; fewer midfielders is enumerated first.
  EXPECT_EQ(lineup.formation.label(), "5-2-3");
  EXPECT_DOUBLE_EQ(lineup.selection_score, 56.0);
}

TEST(SelectLineupTest, DoubtfulStarterDoesNotTakeArmband) {
  std::vector<Availability> avail(15, Availability::Available);
  avail[7] = Availability::Doubtful;
  const auto lineup =
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints, avail));

  // Still starts on half weight, but the armband goes to available players.
  EXPECT_TRUE(starts(lineup, 8));
  EXPECT_DOUBLE_EQ(lineup.selection_score, 59.5);
  EXPECT_EQ(lineup.captain_id, 9);
  EXPECT_EQ(lineup.vice_captain_id, 13);
}

// -----------------------------------------------------------------------------
// 3. Configuration errors
// -----------------------------------------------------------------------------
TEST(SelectLineupTest, NoFormationFitsSquad) {
  fpl_core::LineupConfig cfg;
  cfg.formation.min_by_pos[3] = 4;
  cfg.formation.max_by_pos[3] = 4;
  EXPECT_THROW(
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints), cfg),
      fpl_core::NoValidFormationError);
}

TEST(SelectLineupTest, FactorsOutsideUnitRangeRejected) {
  fpl_core::LineupConfig cfg;
  cfg.doubtful_factor = 1.5;
  EXPECT_THROW(
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints), cfg),
      fpl_core::InvalidConfigurationError);
}

TEST(LineupTest, ArmbandLookupOutsideStartersThrows) {
  fpl_core::Lineup lineup;
  lineup.captain_id = 99;
  EXPECT_THROW(lineup.captain(), std::out_of_range);
}

// -----------------------------------------------------------------------------
// 4. score_lineup()
// -----------------------------------------------------------------------------
TEST(ScoreLineupTest, CaptainDoublesAndChipsApply) {
  const auto lineup =
      fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints));

  EXPECT_DOUBLE_EQ(fpl_core::score_lineup(lineup), 64.0 + 9.0);

  fpl_core::ScoringOptions tc;
  tc.triple_captain = true;
  EXPECT_DOUBLE_EQ(fpl_core::score_lineup(lineup, tc), 64.0 + 18.0);

  fpl_core::ScoringOptions bb;
  bb.bench_boost = true;
  EXPECT_DOUBLE_EQ(fpl_core::score_lineup(lineup, bb), 64.0 + 5.0 + 9.0);
}

TEST(ScoreLineupTest, ActualPointsFallBackToViceCaptain) {
  auto lineup = fpl_core::select_lineup(fpl_test::squadWithPoints(kPoints));
  for (auto &p : lineup.starters) {
    if (p.id == lineup.captain_id)
      continue; // did not play
    p.actual_points = p.id == lineup.vice_captain_id ? 6.0 : 2.0;
  }

  fpl_core::ScoringOptions actual;
  actual.use_actual_points = true;
  // Nine starters on 2, the vice on 6 and doubled, the captain on nothing.
  EXPECT_DOUBLE_EQ(fpl_core::score_lineup(lineup, actual), 18.0 + 12.0);

  for (auto &p : lineup.starters) {
    if (p.id == lineup.captain_id)
      p.actual_points = 10.0;
  }
  EXPECT_DOUBLE_EQ(fpl_core::score_lineup(lineup, actual),
                   18.0 + 6.0 + 20.0);
}
