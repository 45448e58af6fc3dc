#include "fpl_core/squad.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

namespace fpl_core {

Squad::Squad(std::vector<Player> players) : players_(std::move(players)) {
  std::sort(players_.begin(), players_.end(),
            [](const Player &a, const Player &b) {
              if (a.position != b.position)
                return position_index(a.position) < position_index(b.position);
              return a.id < b.id;
            });
  for (const auto &p : players_) {
    total_cost_ += p.cost;
    total_predicted_ += p.predicted_points;
  }
}

Squad Squad::from_players(std::vector<Player> players,
                          const SquadConstraintSet &cons) {
  if (static_cast<int>(players.size()) != cons.squad_size) {
    throw InvalidInputError(
        fmt::format("Squad.from_players: expected {} players, got {}",
                    cons.squad_size, players.size()));
  }

  std::unordered_set<std::int64_t> ids;
  std::unordered_map<std::string, int> per_club;
  Eigen::ArrayXi per_pos = Eigen::ArrayXi::Zero(kNumPositions);
  Money cost = 0;
  for (const auto &p : players) {
    if (!ids.insert(p.id).second) {
      throw InvalidInputError(fmt::format(
          "Squad.from_players: player {} appears more than once", p.id));
    }
    ++per_pos[position_index(p.position)];
    if (++per_club[p.club] > cons.max_per_club) {
      throw InvalidInputError(
          fmt::format("Squad.from_players: more than {} players from {}",
                      cons.max_per_club, p.club));
    }
    cost += p.cost;
  }
  for (int i = 0; i < kNumPositions; ++i) {
    if (per_pos[i] != cons.position_quota[i]) {
      throw InvalidInputError(fmt::format(
          "Squad.from_players: {} {} players, quota is {}", per_pos[i],
          position_code(position_from_index(i)), cons.position_quota[i]));
    }
  }
  if (cost > cons.budget) {
    throw InvalidInputError(fmt::format(
        "Squad.from_players: cost {} exceeds budget {}", cost, cons.budget));
  }
  return Squad(std::move(players));
}

Eigen::ArrayXi Squad::count_by_position() const {
  Eigen::ArrayXi counts = Eigen::ArrayXi::Zero(kNumPositions);
  for (const auto &p : players_)
    ++counts[position_index(p.position)];
  return counts;
}

bool Squad::contains(std::int64_t id) const {
  return std::any_of(players_.begin(), players_.end(),
                     [id](const Player &p) { return p.id == id; });
}

} // namespace fpl_core
