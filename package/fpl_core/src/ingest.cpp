#include "fpl_core/ingest.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace fpl_core {

namespace {

Position resolve_position(const RawPlayerRecord &r) {
  if (r.element_type) {
    const int et = *r.element_type;
    if (et < 1 || et > kNumPositions) {
      throw DataValidationError(fmt::format(
          "ingest: player {} has unknown element_type {}", r.id, et));
    }
    return position_from_index(et - 1);
  }
  if (r.position) {
    const auto p = parse_position(*r.position);
    if (!p) {
      throw DataValidationError(fmt::format(
          "ingest: player {} has unknown position '{}'", r.id, *r.position));
    }
    return *p;
  }
  throw DataValidationError(
      fmt::format("ingest: player {} is missing a position", r.id));
}

std::string resolve_club(const RawPlayerRecord &r) {
  if (r.team_name && !r.team_name->empty())
    return *r.team_name;
  if (r.team)
    return fmt::format("team-{}", *r.team);
  throw DataValidationError(
      fmt::format("ingest: player {} is missing a club", r.id));
}

Money resolve_cost(const RawPlayerRecord &r) {
  if (r.now_cost) {
    if (*r.now_cost < 0) {
      throw DataValidationError(fmt::format(
          "ingest: player {} has negative cost {}", r.id, *r.now_cost));
    }
    return *r.now_cost;
  }
  if (r.cost) {
    const double millions = *r.cost;
    if (!std::isfinite(millions) || millions < 0.0) {
      throw DataValidationError(fmt::format(
          "ingest: player {} has invalid cost {}", r.id, millions));
    }
    const double tenths = millions * 10.0;
    const double rounded = std::round(tenths);
    if (std::fabs(tenths - rounded) > 1e-6) {
      throw DataValidationError(fmt::format(
          "ingest: player {} cost {} is not a multiple of 0.1m", r.id,
          millions));
    }
    return static_cast<Money>(rounded);
  }
  throw DataValidationError(
      fmt::format("ingest: player {} is missing a cost", r.id));
}

Availability resolve_availability(const RawPlayerRecord &r) {
  if (!r.status)
    return Availability::Available;
  const auto a = parse_availability(*r.status);
  if (!a) {
    throw DataValidationError(fmt::format(
        "ingest: player {} has unknown status '{}'", r.id, *r.status));
  }
  return *a;
}

} // namespace

std::vector<Player> ingest(const std::vector<RawPlayerRecord> &records,
                           const IngestConfig &cfg) {
  // ICT is scaled against the best value in the batch
  double max_ict = 0.0;
  for (const auto &r : records) {
    if (r.ict_index && std::isfinite(*r.ict_index))
      max_ict = std::max(max_ict, *r.ict_index);
  }

  PlayerCatalog catalog;
  for (const auto &r : records) {
    Player p;
    p.id = r.id;
    p.name = r.web_name ? *r.web_name : r.name.value_or(std::string{});
    p.position = resolve_position(r);
    p.club = resolve_club(r);
    p.cost = resolve_cost(r);
    p.availability = resolve_availability(r);
    p.minutes = r.minutes.value_or(0);
    p.actual_points = r.event_points;

    if (r.predicted_points) {
      p.predicted_points = *r.predicted_points;
    } else if (r.ep_next) {
      const double ict_term =
          (max_ict > 0.0 && r.ict_index) ? (*r.ict_index / max_ict) : 0.0;
      double xp = cfg.w_ep_next * *r.ep_next +
                  cfg.w_form * r.form.value_or(0.0) +
                  cfg.w_ict * ict_term * cfg.ict_scale;
      if (cfg.clip_derived_at_zero)
        xp = std::max(0.0, xp);
      p.predicted_points = xp;
    }
    if (!std::isfinite(p.predicted_points)) {
      throw DataValidationError(fmt::format(
          "ingest: player {} has non-finite predicted points", r.id));
    }

    catalog.add_player(p);
  }
  return catalog.players();
}

std::vector<Player> eligible_players(const std::vector<Player> &players,
                                     const EligibilityFilter &filter) {
  std::vector<Player> out;
  out.reserve(players.size());
  for (const auto &p : players) {
    if (p.availability == Availability::Unavailable)
      continue;
    if (p.availability == Availability::Doubtful && !filter.allow_doubtful)
      continue;
    if (p.minutes < filter.min_minutes)
      continue;
    out.push_back(p);
  }
  return out;
}

} // namespace fpl_core
