#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fpl_core/player.hpp"

namespace fpl_core {

// One player as delivered by a data source. Field names follow the FPL
// bootstrap-static payload; the normalized aliases (position, club, cost,
// predicted_points) let other sources feed the same path.
struct RawPlayerRecord {
  std::int64_t id{0};
  std::optional<std::string> web_name;
  std::optional<std::string> name;

  std::optional<int> element_type; // 1=GK, 2=DEF, 3=MID, 4=FWD
  std::optional<std::string> position;

  std::optional<int> team;
  std::optional<std::string> team_name;

  std::optional<int> now_cost; // tenths of a million
  std::optional<double> cost;  // millions

  std::optional<double> predicted_points;
  std::optional<double> ep_next;
  std::optional<double> form;
  std::optional<double> ict_index;

  std::optional<double> event_points;
  std::optional<std::string> status;
  std::optional<int> minutes;
};

// Weights for deriving predicted points when a record carries no explicit
// prediction: w_ep * ep_next + w_form * form + w_ict * (ict / max_ict) * scale.
struct IngestConfig {
  double w_ep_next{0.6};
  double w_form{0.3};
  double w_ict{0.1};
  double ict_scale{10.0};
  bool clip_derived_at_zero{true};
};

std::vector<Player> ingest(const std::vector<RawPlayerRecord> &records,
                           const IngestConfig &cfg = {});

struct EligibilityFilter {
  bool allow_doubtful{true};
  int min_minutes{0};
};

// Players the optimizer may pick: never unavailable ones.
std::vector<Player> eligible_players(const std::vector<Player> &players,
                                     const EligibilityFilter &filter = {});

} // namespace fpl_core
