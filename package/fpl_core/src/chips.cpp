#include "fpl_core/chips.hpp"

#include <fmt/format.h>

namespace fpl_core {

std::string chip_name(Chip c) {
  switch (c) {
  case Chip::TripleCaptain:
    return "Triple Captain";
  case Chip::BenchBoost:
    return "Bench Boost";
  case Chip::FreeHit:
    return "Free Hit";
  }
  return "Unknown";
}

int GameweekContext::fixtures_for(const std::string &club) const {
  auto it = fixtures_by_club.find(club);
  return it == fixtures_by_club.end() ? 1 : it->second;
}

ChipRecommendation evaluate_triple_captain(const Lineup &lineup,
                                           const ChipConfig &cfg) {
  ChipRecommendation rec;
  rec.chip = Chip::TripleCaptain;
  rec.threshold = cfg.triple_captain_multiple;

  const Player &captain = lineup.captain();
  const std::size_t n = lineup.starters.size() + lineup.bench.size();
  const double avg = n == 0 ? 0.0
                            : (lineup.starters_predicted_points() +
                               lineup.bench_predicted_points()) /
                                  static_cast<double>(n);
  if (avg <= 0.0) {
    rec.rationale = fmt::format(
        "squad averages {:.2f} predicted points, no baseline to compare", avg);
    return rec;
  }
  rec.score = captain.predicted_points / avg;
  rec.recommend = rec.score > rec.threshold;
  rec.rationale = fmt::format(
      "captain {} predicted {:.2f} is {:.2f}x the squad average {:.2f}",
      captain.name, captain.predicted_points, rec.score, avg);
  return rec;
}

ChipRecommendation evaluate_bench_boost(const Lineup &lineup,
                                        const ChipConfig &cfg) {
  ChipRecommendation rec;
  rec.chip = Chip::BenchBoost;
  rec.threshold = cfg.bench_boost_fraction;

  const double xi = lineup.starters_predicted_points();
  const double bench = lineup.bench_predicted_points();
  if (xi <= 0.0) {
    rec.rationale = fmt::format(
        "starting XI predicted {:.2f} points, no baseline to compare", xi);
    return rec;
  }
  rec.score = bench / xi;
  rec.recommend = rec.score > rec.threshold;
  rec.rationale =
      fmt::format("bench predicted {:.2f} is {:.1f}% of the XI's {:.2f}",
                  bench, 100.0 * rec.score, xi);
  return rec;
}

ChipRecommendation evaluate_free_hit(const Lineup &lineup,
                                     const GameweekContext &ctx,
                                     const ChipConfig &cfg) {
  ChipRecommendation rec;
  rec.chip = Chip::FreeHit;
  rec.threshold = cfg.free_hit_fraction;

  int unavailable = 0;
  int blank = 0;
  for (const auto &p : lineup.starters) {
    if (p.availability == Availability::Unavailable)
      ++unavailable;
    else if (ctx.fixtures_for(p.club) <= 0)
      ++blank;
  }
  const std::size_t n = lineup.starters.size();
  if (n == 0) {
    rec.rationale = "no starters";
    return rec;
  }
  rec.score = static_cast<double>(unavailable + blank) / static_cast<double>(n);
  rec.recommend = rec.score >= rec.threshold;
  rec.rationale = fmt::format(
      "{} of {} starters out ({} unavailable, {} without a fixture)",
      unavailable + blank, n, unavailable, blank);
  return rec;
}

std::vector<ChipRecommendation> evaluate_chips(const Lineup &lineup,
                                               const GameweekContext &ctx,
                                               const ChipConfig &cfg) {
  std::vector<ChipRecommendation> out;
  out.reserve(ctx.available_chips.size());
  for (const Chip c : ctx.available_chips) {
    switch (c) {
    case Chip::TripleCaptain:
      out.push_back(evaluate_triple_captain(lineup, cfg));
      break;
    case Chip::BenchBoost:
      out.push_back(evaluate_bench_boost(lineup, cfg));
      break;
    case Chip::FreeHit:
      out.push_back(evaluate_free_hit(lineup, ctx, cfg));
      break;
    }
  }
  return out;
}

} // namespace fpl_core
