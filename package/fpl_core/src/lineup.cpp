#include "fpl_core/lineup.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include <fmt/format.h>

namespace fpl_core {

namespace {

double availability_factor(const Player &p, const LineupConfig &cfg) {
  switch (p.availability) {
  case Availability::Available:
    return 1.0;
  case Availability::Doubtful:
    return cfg.doubtful_factor;
  case Availability::Unavailable:
    return cfg.unavailable_factor;
  }
  return 0.0;
}

const Player &find_starter(const Lineup &lineup, std::int64_t id,
                           const char *role) {
  for (const auto &p : lineup.starters) {
    if (p.id == id)
      return p;
  }
  throw std::out_of_range(
      fmt::format("Lineup.{}: player {} is not a starter", role, id));
}

double sum_predicted(const std::vector<Player> &players) {
  double s = 0.0;
  for (const auto &p : players)
    s += p.predicted_points;
  return s;
}

} // namespace

std::string Formation::label() const {
  return fmt::format("{}-{}-{}", defenders, midfielders, forwards);
}

const Player &Lineup::captain() const {
  return find_starter(*this, captain_id, "captain");
}

const Player &Lineup::vice_captain() const {
  return find_starter(*this, vice_captain_id, "vice_captain");
}

double Lineup::starters_predicted_points() const {
  return sum_predicted(starters);
}

double Lineup::bench_predicted_points() const { return sum_predicted(bench); }

Lineup select_lineup(const Squad &squad, const LineupConfig &cfg) {
  check_formation_rule(cfg.formation);
  if (cfg.doubtful_factor < 0.0 || cfg.doubtful_factor > 1.0 ||
      cfg.unavailable_factor < 0.0 || cfg.unavailable_factor > 1.0) {
    throw InvalidConfigurationError(
        "select_lineup: availability factors must lie in [0, 1]");
  }

  // Per position, players ranked by effective score; ties fall back to raw
  // predicted points, then id.
  std::array<std::vector<const Player *>, kNumPositions> by_pos;
  for (const auto &p : squad.players())
    by_pos[position_index(p.position)].push_back(&p);
  std::array<std::vector<double>, kNumPositions> prefix;
  for (int i = 0; i < kNumPositions; ++i) {
    auto &v = by_pos[i];
    std::stable_sort(v.begin(), v.end(), [&](const Player *a, const Player *b) {
      const double ea = a->predicted_points * availability_factor(*a, cfg);
      const double eb = b->predicted_points * availability_factor(*b, cfg);
      if (ea != eb)
        return ea > eb;
      if (a->predicted_points != b->predicted_points)
        return a->predicted_points > b->predicted_points;
      return a->id < b->id;
    });
    prefix[i].assign(v.size() + 1, 0.0);
    for (std::size_t j = 0; j < v.size(); ++j) {
      prefix[i][j + 1] =
          prefix[i][j] + v[j]->predicted_points * availability_factor(*v[j], cfg);
    }
  }

  const FormationRule &rule = cfg.formation;
  auto hi = [&](int pos) {
    return std::min(rule.max_by_pos[pos], static_cast<int>(by_pos[pos].size()));
  };

  std::array<int, kNumPositions> best_counts{};
  double best_score = -std::numeric_limits<double>::infinity();
  bool found = false;
  for (int g = rule.min_by_pos[0]; g <= hi(0); ++g) {
    for (int d = rule.min_by_pos[1]; d <= hi(1); ++d) {
      for (int m = rule.min_by_pos[2]; m <= hi(2); ++m) {
        const int f = rule.starters - g - d - m;
        if (f < rule.min_by_pos[3] || f > hi(3))
          continue;
        const double score = prefix[0][g] + prefix[1][d] + prefix[2][m] +
                             prefix[3][f];
        if (!found || score > best_score) {
          best_score = score;
          best_counts = {g, d, m, f};
          found = true;
        }
      }
    }
  }
  if (!found) {
    const Eigen::ArrayXi counts = squad.count_by_position();
    throw NoValidFormationError(fmt::format(
        "select_lineup: squad with {} GKP, {} DEF, {} MID, {} FWD fits no "
        "legal formation",
        counts[0], counts[1], counts[2], counts[3]));
  }

  Lineup lineup;
  lineup.formation = Formation{best_counts[1], best_counts[2], best_counts[3]};
  lineup.selection_score = best_score;

  std::vector<Player> outfield_bench;
  std::vector<Player> keeper_bench;
  for (int i = 0; i < kNumPositions; ++i) {
    const auto &v = by_pos[i];
    for (std::size_t j = 0; j < v.size(); ++j) {
      if (static_cast<int>(j) < best_counts[i]) {
        lineup.starters.push_back(*v[j]);
      } else if (v[j]->position == Position::Goalkeeper) {
        keeper_bench.push_back(*v[j]);
      } else {
        outfield_bench.push_back(*v[j]);
      }
    }
  }

  auto by_points_then_id = [](const Player &a, const Player &b) {
    if (a.predicted_points != b.predicted_points)
      return a.predicted_points > b.predicted_points;
    return a.id < b.id;
  };
  std::sort(outfield_bench.begin(), outfield_bench.end(), by_points_then_id);
  std::sort(keeper_bench.begin(), keeper_bench.end(), by_points_then_id);
  lineup.bench = std::move(outfield_bench);
  lineup.bench.insert(lineup.bench.end(), keeper_bench.begin(),
                      keeper_bench.end());

  std::sort(lineup.starters.begin(), lineup.starters.end(),
            [](const Player &a, const Player &b) {
              if (a.position != b.position)
                return position_index(a.position) < position_index(b.position);
              return a.id < b.id;
            });

  std::vector<const Player *> armband;
  for (const auto &p : lineup.starters)
    armband.push_back(&p);
  std::sort(armband.begin(), armband.end(),
            [](const Player *a, const Player *b) {
              if (a->is_available() != b->is_available())
                return a->is_available();
              if (a->predicted_points != b->predicted_points)
                return a->predicted_points > b->predicted_points;
              return a->id < b->id;
            });
  if (armband.size() < 2) {
    throw NoValidFormationError(
        "select_lineup: fewer than two starters to carry the armband");
  }
  lineup.captain_id = armband[0]->id;
  lineup.vice_captain_id = armband[1]->id;

  if (cfg.verbose) {
    fmt::print("[Debug] select_lineup: formation={} score={:.2f} captain={} "
               "vice={}\n",
               lineup.formation.label(), lineup.selection_score,
               armband[0]->name, armband[1]->name);
  }
  return lineup;
}

double score_lineup(const Lineup &lineup, const ScoringOptions &opts) {
  auto points = [&](const Player &p) {
    return opts.use_actual_points ? p.actual_points.value_or(0.0)
                                  : p.predicted_points;
  };

  double total = 0.0;
  for (const auto &p : lineup.starters)
    total += points(p);
  if (opts.bench_boost) {
    for (const auto &p : lineup.bench)
      total += points(p);
  }

  const Player *holder = &lineup.captain();
  if (opts.use_actual_points && !holder->actual_points) {
    const Player &vice = lineup.vice_captain();
    if (vice.actual_points)
      holder = &vice;
  }
  const double multiplier = opts.triple_captain ? 3.0 : 2.0;
  total += (multiplier - 1.0) * points(*holder);
  return total;
}

} // namespace fpl_core
