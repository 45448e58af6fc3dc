#pragma once

#include <map>
#include <string>
#include <vector>

#include "fpl_core/lineup.hpp"

namespace fpl_core {

enum class Chip { TripleCaptain, BenchBoost, FreeHit };

std::string chip_name(Chip c);

struct GameweekContext {
  int gameweek{0};
  // Fixtures per club this gameweek: 0 blank, 1 single, 2 double. Clubs not
  // listed are assumed to play once.
  std::map<std::string, int> fixtures_by_club;
  std::vector<Chip> available_chips{Chip::TripleCaptain, Chip::BenchBoost,
                                    Chip::FreeHit};

  int fixtures_for(const std::string &club) const;
};

struct ChipConfig {
  // Captain must exceed this multiple of the squad's per-player average.
  double triple_captain_multiple{1.5};
  // Bench must exceed this fraction of the starting XI's points.
  double bench_boost_fraction{0.40};
  // Share of starters that are unavailable or without a fixture at which a
  // Free Hit is advised.
  double free_hit_fraction{0.35};
};

struct ChipRecommendation {
  Chip chip{Chip::TripleCaptain};
  bool recommend{false};
  double score{0.0};
  double threshold{0.0};
  std::string rationale;
};

// One evaluation per chip still available in the context, in the order the
// context lists them. Prioritising between recommended chips is left to the
// caller.
std::vector<ChipRecommendation> evaluate_chips(const Lineup &lineup,
                                               const GameweekContext &ctx,
                                               const ChipConfig &cfg = {});

// The squad average covers starters and bench alike.
ChipRecommendation evaluate_triple_captain(const Lineup &lineup,
                                           const ChipConfig &cfg = {});
ChipRecommendation evaluate_bench_boost(const Lineup &lineup,
                                        const ChipConfig &cfg = {});
ChipRecommendation evaluate_free_hit(const Lineup &lineup,
                                     const GameweekContext &ctx,
                                     const ChipConfig &cfg = {});

} // namespace fpl_core
