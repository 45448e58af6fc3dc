#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "fpl_core/errors.hpp"

namespace fpl_core {

// Money in tenths of a million (45 == 4.5m).
using Money = int;

enum class Position { Goalkeeper = 0, Defender = 1, Midfielder = 2, Forward = 3 };

inline constexpr int kNumPositions = 4;

enum class Availability { Available, Doubtful, Unavailable };

inline int position_index(Position p) { return static_cast<int>(p); }

inline Position position_from_index(int idx) {
  if (idx < 0 || idx >= kNumPositions) {
    throw std::out_of_range("position_from_index: index out of range");
  }
  return static_cast<Position>(idx);
}

// Short FPL codes: GKP, DEF, MID, FWD.
std::string position_code(Position p);

std::string availability_name(Availability a);

// Accepts FPL codes, single letters and full names, case-insensitive.
std::optional<Position> parse_position(const std::string &text);

// Accepts FPL status letters (a, d, i, s, u, n) and full words.
std::optional<Availability> parse_availability(const std::string &text);

struct Player {
  std::int64_t id{0};
  std::string name;
  Position position{Position::Goalkeeper};
  std::string club;
  Money cost{0};
  double predicted_points{0.0};
  std::optional<double> actual_points;
  Availability availability{Availability::Available};
  int minutes{0};

  Player() = default;
  Player(std::int64_t id_, std::string name_, Position position_,
         std::string club_, Money cost_, double predicted_points_)
      : id(id_), name(std::move(name_)), position(position_),
        club(std::move(club_)), cost(cost_),
        predicted_points(predicted_points_) {}

  bool is_available() const {
    return availability == Availability::Available;
  }
};

class PlayerCatalog {
public:
  PlayerCatalog() = default;

  void add_player(const Player &p) {
    if (has_id(p.id)) {
      throw DuplicatePlayerError(
          fmt::format("PlayerCatalog.add_player: duplicate player id {}", p.id));
    }
    const std::size_t idx = players_.size();
    players_.push_back(p);
    id_index_[p.id] = idx;
  }

  std::size_t size() const { return players_.size(); }

  bool has_id(const std::int64_t &id) const {
    return id_index_.find(id) != id_index_.end();
  }

  const Player &get_by_id(const std::int64_t &id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range(
          fmt::format("PlayerCatalog.get_by_id: id {} not found", id));
    }
    return players_.at(it->second);
  }

  const std::vector<Player> &players() const { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::int64_t, std::size_t> id_index_;
};

} // namespace fpl_core
