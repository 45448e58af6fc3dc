#include "fpl_core/optimizer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

namespace fpl_core {

namespace {

using Value = std::int64_t;
using Table =
    Eigen::Matrix<Value, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ValueRow = Eigen::Matrix<Value, 1, Eigen::Dynamic>;
using ValueVector = Eigen::Matrix<Value, Eigen::Dynamic, 1>;

// Marks an unreachable (infeasible) table cell.
constexpr Value kNeg = std::numeric_limits<Value>::min() / 4;
// Per-player magnitude limit so that a 15-player sum stays inside int64.
constexpr double kMaxAbsValue = 1e17;

double elapsed_ms_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - t0)
      .count();
}

// Decodes points * mult - cost (0 <= cost < mult) back to scaled points.
Value scaled_points(Value v, Value mult) {
  return v / mult + ((v % mult) > 0 ? 1 : 0);
}

class BranchAndBound {
public:
  // `order` must be sorted by (position, id) and outlive the search.
  BranchAndBound(const std::vector<Player> &order,
                 const SquadConstraintSet &cons, const OptimizerConfig &cfg,
                 SearchStats &stats,
                 std::chrono::steady_clock::time_point t0);

  // Builds the bound tables, tunes the club multipliers and seeds the
  // incumbent. Returns the root bound, kNeg when even the relaxation has no
  // solution.
  Value prepare();

  // Runs the search; false when no squad satisfies the club caps.
  bool run();

  std::vector<std::size_t> selection() const;
  Value multiplier() const { return mult_; }

private:
  int row(int p, int j, int k) const { return j * (quota_[p] + 1) + k; }

  Value completion(int p, int j, int k, int r) const {
    return tables_[static_cast<std::size_t>(p)](row(p, j, k), r);
  }

  Value build_tables();
  Value tighten(Value root);
  void apply_multipliers();
  std::vector<char> relaxed_selection() const;
  std::optional<std::vector<char>> repair(std::vector<char> x) const;

  void check_clock() const;
  void tick();
  void search(int p, int j, int k, int r, Value acc);
  bool worth_entering(Value bound, std::size_t i, char decision) const;
  void consider(const std::vector<char> &x, Value acc);

  const std::vector<Player> &order_;
  const OptimizerConfig &cfg_;
  SearchStats &stats_;
  std::chrono::steady_clock::time_point t0_;

  std::array<int, kNumPositions> start_{};
  std::array<int, kNumPositions> size_{};
  std::array<int, kNumPositions> quota_{};
  int max_per_club_{0};
  int cap_{0};
  Value mult_{1};

  Eigen::VectorXi cost_;
  ValueVector value_;
  Eigen::VectorXi club_;
  Eigen::ArrayXi club_count_;

  // One multiplier per club; weight_ is value_ less the player's club
  // multiplier.
  ValueVector lambda_;
  ValueVector weight_;
  // Sum of lambda_ over the open slots of every club on the current path.
  Value slack_{0};

  // tables_[p](row(p, j, k), r): best weight picking k more players from
  // block p starting at local index j plus full quotas of every later
  // block, spending at most r.
  std::vector<Table> tables_;

  std::vector<char> x_;
  std::vector<char> best_x_;
  Value best_{kNeg};
  bool have_best_{false};
};

BranchAndBound::BranchAndBound(const std::vector<Player> &order,
                               const SquadConstraintSet &cons,
                               const OptimizerConfig &cfg, SearchStats &stats,
                               std::chrono::steady_clock::time_point t0)
    : order_(order), cfg_(cfg), stats_(stats), t0_(t0),
      max_per_club_(cons.max_per_club) {
  const int n = static_cast<int>(order_.size());
  for (int p = 0; p < kNumPositions; ++p) {
    quota_[p] = cons.position_quota[p];
    start_[p] = n;
  }
  for (int i = n - 1; i >= 0; --i) {
    const int p = position_index(order_[i].position);
    start_[p] = i;
    ++size_[p];
  }

  // No legal squad can spend more than its most expensive quota-filling
  // picks, so the budget axis is capped there.
  long long max_spend = 0;
  for (int p = 0; p < kNumPositions; ++p) {
    std::vector<int> costs;
    costs.reserve(static_cast<std::size_t>(size_[p]));
    for (int j = 0; j < size_[p]; ++j)
      costs.push_back(order_[start_[p] + j].cost);
    std::sort(costs.begin(), costs.end(), std::greater<int>());
    for (int j = 0; j < quota_[p] && j < size_[p]; ++j)
      max_spend += costs[j];
  }
  cap_ = static_cast<int>(std::min<long long>(cons.budget, max_spend));
  mult_ = static_cast<Value>(cap_) + 1;

  long long cells = 0;
  for (int p = 0; p < kNumPositions; ++p)
    cells += (size_[p] + 1LL) * (quota_[p] + 1LL);
  cells *= static_cast<long long>(cap_) + 1;
  if (cells > kMaxRelaxationCells) {
    throw InvalidInputError(fmt::format(
        "SquadOptimizer.optimize: bound tables for {} candidates and a spend "
        "cap of {} need {} cells, more than the limit of {}",
        n, cap_, cells, kMaxRelaxationCells));
  }

  std::unordered_map<std::string, int> club_idx;
  cost_.resize(n);
  value_.resize(n);
  club_.resize(n);
  for (int i = 0; i < n; ++i) {
    const Player &pl = order_[i];
    const double scaled = pl.predicted_points * cfg_.points_resolution;
    if (std::fabs(scaled) * static_cast<double>(mult_) > kMaxAbsValue) {
      throw InvalidInputError(fmt::format(
          "SquadOptimizer.optimize: predicted points {} of player {} are out "
          "of range",
          pl.predicted_points, pl.id));
    }
    cost_[i] = pl.cost;
    value_[i] = static_cast<Value>(std::llround(scaled)) * mult_ - pl.cost;
    auto it = club_idx.find(pl.club);
    if (it == club_idx.end())
      it = club_idx.emplace(pl.club, static_cast<int>(club_idx.size())).first;
    club_[i] = it->second;
  }
  club_count_ =
      Eigen::ArrayXi::Zero(static_cast<Eigen::Index>(club_idx.size()));
  x_.assign(static_cast<std::size_t>(n), 0);
}

Value BranchAndBound::prepare() {
  lambda_ = ValueVector::Zero(club_count_.size());
  apply_multipliers();
  const Value root = build_tables();
  if (root == kNeg)
    return kNeg;
  const Value bound = tighten(root);
  slack_ = static_cast<Value>(max_per_club_) * lambda_.sum();
  return bound;
}

void BranchAndBound::apply_multipliers() {
  weight_.resize(value_.size());
  for (Eigen::Index i = 0; i < value_.size(); ++i)
    weight_[i] = value_[i] - lambda_[club_[i]];
}

Value BranchAndBound::build_tables() {
  const int width = cap_ + 1;
  if (tables_.empty()) {
    tables_.resize(kNumPositions);
    for (int p = 0; p < kNumPositions; ++p)
      tables_[p].resize((size_[p] + 1) * (quota_[p] + 1), width);
  }
  ValueRow next = ValueRow::Zero(width);
  for (int p = kNumPositions - 1; p >= 0; --p) {
    const int n = size_[p];
    const int q = quota_[p];
    Table &t = tables_[static_cast<std::size_t>(p)];
    t.setConstant(kNeg);
    t.row(row(p, n, 0)) = next;
    for (int j = n - 1; j >= 0; --j) {
      check_clock();
      const int i = start_[p] + j;
      const int c = cost_[i];
      const Value w = weight_[i];
      t.row(row(p, j, 0)) = next;
      // Rows are contiguous in the row-major table.
      for (int k = 1; k <= q; ++k) {
        const Value *skip = t.data() + std::ptrdiff_t{row(p, j + 1, k)} * width;
        const Value *take =
            t.data() + std::ptrdiff_t{row(p, j + 1, k - 1)} * width;
        Value *cur = t.data() + std::ptrdiff_t{row(p, j, k)} * width;
        for (int r = 0; r < width; ++r) {
          Value best = skip[r];
          if (c <= r && take[r - c] != kNeg)
            best = std::max(best, w + take[r - c]);
          cur[r] = best;
        }
      }
    }
    next = t.row(row(p, 0, q));
  }
  return next[cap_];
}

// Subgradient steps on the club multipliers. A club picked past its cap in
// the relaxed squad gets a higher multiplier, one left with room and a
// positive multiplier a lower one. The step length aims at the best repaired
// squad. The smallest bound seen wins and its tables are kept.
Value BranchAndBound::tighten(Value root) {
  ValueVector best_lambda = lambda_;
  Value best_bound = root;
  Value bound = root;
  double theta = 2.0;
  int stall = 0;
  const int clubs = static_cast<int>(lambda_.size());
  for (int it = 0; it < cfg_.bound_iterations; ++it) {
    ++stats_.bound_iterations;
    const std::vector<char> relaxed = relaxed_selection();
    if (auto fixed = repair(relaxed)) {
      Value acc = 0;
      for (std::size_t i = 0; i < fixed->size(); ++i) {
        if ((*fixed)[i])
          acc += value_[static_cast<Eigen::Index>(i)];
      }
      consider(*fixed, acc);
    }

    if (it > 0 && bound < best_bound) {
      best_bound = bound;
      best_lambda = lambda_;
      stall = 0;
    } else if (it > 0 && ++stall >= 3) {
      theta /= 2.0;
      stall = 0;
    }

    Eigen::ArrayXi over = Eigen::ArrayXi::Constant(clubs, -max_per_club_);
    for (std::size_t i = 0; i < relaxed.size(); ++i) {
      if (relaxed[i])
        ++over[club_[static_cast<Eigen::Index>(i)]];
    }
    double norm = 0.0;
    for (int c = 0; c < clubs; ++c) {
      if (over[c] <= 0 && lambda_[c] == 0)
        over[c] = 0;
      norm += static_cast<double>(over[c]) * over[c];
    }
    if (norm == 0.0 || (have_best_ && best_bound <= best_) || theta < 1e-3)
      break;
    const Value target = have_best_ ? best_ : bound - std::abs(bound) / 20;
    const double step = theta * static_cast<double>(bound - target) / norm;
    if (step <= 0.0)
      break;
    for (int c = 0; c < clubs; ++c) {
      lambda_[c] = std::max<Value>(
          0, std::llround(static_cast<double>(lambda_[c]) + step * over[c]));
    }
    apply_multipliers();
    bound = build_tables() + static_cast<Value>(max_per_club_) * lambda_.sum();
  }
  if (bound < best_bound) {
    best_bound = bound;
    best_lambda = lambda_;
  }
  if ((best_lambda.array() != lambda_.array()).any()) {
    lambda_ = best_lambda;
    apply_multipliers();
    build_tables();
  }
  return best_bound;
}

// Reads the relaxed optimum back out of the tables, taking a player whenever
// taking it attains the cell's value.
std::vector<char> BranchAndBound::relaxed_selection() const {
  std::vector<char> x(order_.size(), 0);
  int r = cap_;
  for (int p = 0; p < kNumPositions; ++p) {
    int k = quota_[p];
    for (int j = 0; j < size_[p] && k > 0; ++j) {
      const int i = start_[p] + j;
      const int c = cost_[i];
      if (c > r)
        continue;
      const Value inner = completion(p, j + 1, k - 1, r - c);
      if (inner != kNeg && inner + weight_[i] == completion(p, j, k, r)) {
        x[static_cast<std::size_t>(i)] = 1;
        --k;
        r -= c;
      }
    }
  }
  return x;
}

// Turns a relaxed squad into a legal one: the weakest picks of over-full
// clubs are dropped, then each freed slot goes to the best affordable player
// of the same position whose club has room. Empty when a slot stays open.
std::optional<std::vector<char>>
BranchAndBound::repair(std::vector<char> x) const {
  const int n = static_cast<int>(x.size());
  Eigen::ArrayXi count = Eigen::ArrayXi::Zero(club_count_.size());
  for (int i = 0; i < n; ++i) {
    if (x[i])
      ++count[club_[i]];
  }
  std::array<int, kNumPositions> need{};
  for (int c = 0; c < static_cast<int>(count.size()); ++c) {
    while (count[c] > max_per_club_) {
      int worst = -1;
      for (int i = n - 1; i >= 0; --i) {
        if (x[i] && club_[i] == c && (worst < 0 || value_[i] < value_[worst]))
          worst = i;
      }
      x[worst] = 0;
      --count[c];
      ++need[position_index(order_[worst].position)];
    }
  }

  long long spent = 0;
  for (int i = 0; i < n; ++i) {
    if (x[i])
      spent += cost_[i];
  }
  for (int p = 0; p < kNumPositions; ++p) {
    for (; need[p] > 0; --need[p]) {
      int pick = -1;
      for (int i = start_[p]; i < start_[p] + size_[p]; ++i) {
        if (x[i] || count[club_[i]] >= max_per_club_ || spent + cost_[i] > cap_)
          continue;
        if (pick < 0 || value_[i] > value_[pick])
          pick = i;
      }
      if (pick < 0)
        return std::nullopt;
      x[pick] = 1;
      ++count[club_[pick]];
      spent += cost_[pick];
    }
  }
  return x;
}

bool BranchAndBound::run() {
  search(0, 0, quota_[0], cap_, 0);
  return have_best_;
}

std::vector<std::size_t> BranchAndBound::selection() const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < best_x_.size(); ++i) {
    if (best_x_[i])
      out.push_back(i);
  }
  return out;
}

void BranchAndBound::check_clock() const {
  if (!cfg_.time_limit)
    return;
  if (elapsed_ms_since(t0_) >= static_cast<double>(cfg_.time_limit->count())) {
    throw TimeoutError(fmt::format(
        "SquadOptimizer.optimize: time limit of {} ms expired after {} "
        "nodes before optimality was proven",
        cfg_.time_limit->count(), stats_.nodes));
  }
}

void BranchAndBound::tick() {
  ++stats_.nodes;
  if (cfg_.max_nodes && stats_.nodes > *cfg_.max_nodes) {
    throw TimeoutError(fmt::format(
        "SquadOptimizer.optimize: node budget of {} exhausted before "
        "optimality was proven",
        *cfg_.max_nodes));
  }
  if ((stats_.nodes & 1023u) == 0)
    check_clock();
}

void BranchAndBound::search(int p, int j, int k, int r, Value acc) {
  tick();
  // A filled block leaves its remaining players unpicked.
  while (p < kNumPositions && k == 0) {
    ++p;
    if (p < kNumPositions) {
      j = 0;
      k = quota_[p];
    }
  }
  if (p == kNumPositions) {
    consider(x_, acc);
    return;
  }
  if (j >= size_[p])
    return;

  const int gi = start_[p] + j;
  const std::size_t i = static_cast<std::size_t>(gi);
  const int c = cost_[gi];
  const int club = club_[gi];

  // Tables hold multiplier-adjusted weights; slack_ credits the open slots.
  Value take_bound = kNeg;
  if (c <= r && club_count_[club] < max_per_club_) {
    const Value inner = completion(p, j + 1, k - 1, r - c);
    if (inner != kNeg)
      take_bound = acc + value_[gi] + inner + slack_ - lambda_[club];
  }
  Value skip_bound = kNeg;
  {
    const Value inner = completion(p, j + 1, k, r);
    if (inner != kNeg)
      skip_bound = acc + inner + slack_;
  }

  // Best bound first; taking wins ties so lower ids are preferred.
  const bool take_first = take_bound >= skip_bound;
  for (int pass = 0; pass < 2; ++pass) {
    const bool take = (pass == 0) == take_first;
    const Value bound = take ? take_bound : skip_bound;
    if (bound == kNeg || !worth_entering(bound, i, take ? 1 : 0))
      continue;
    if (take) {
      x_[i] = 1;
      ++club_count_[club];
      slack_ -= lambda_[club];
      search(p, j + 1, k - 1, r - c, acc + value_[gi]);
      slack_ += lambda_[club];
      --club_count_[club];
      x_[i] = 0;
    } else {
      search(p, j + 1, k, r, acc);
    }
  }
}

bool BranchAndBound::worth_entering(Value bound, std::size_t i,
                                    char decision) const {
  if (!have_best_)
    return true;
  if (bound != best_)
    return bound > best_;
  // Equal bound: only a selection that picks an earlier player can win, or
  // the incumbent's own path, which still has to be walked to prove it.
  for (std::size_t d = 0; d < i; ++d) {
    if (x_[d] != best_x_[d])
      return x_[d] > best_x_[d];
  }
  return decision >= best_x_[i];
}

void BranchAndBound::consider(const std::vector<char> &x, Value acc) {
  if (have_best_) {
    if (acc < best_)
      return;
    if (acc == best_) {
      const auto mism = std::mismatch(x.begin(), x.end(), best_x_.begin());
      if (mism.first == x.end() || *mism.first < *mism.second)
        return;
    }
  }
  best_ = acc;
  best_x_ = x;
  have_best_ = true;
}

void check_player_pool(const std::vector<Player> &players) {
  std::unordered_set<std::int64_t> ids;
  for (const auto &p : players) {
    if (!ids.insert(p.id).second) {
      throw InvalidInputError(fmt::format(
          "SquadOptimizer.optimize: duplicate player id {}", p.id));
    }
    if (p.cost < 0) {
      throw InvalidInputError(fmt::format(
          "SquadOptimizer.optimize: player {} has negative cost", p.id));
    }
    if (!std::isfinite(p.predicted_points)) {
      throw InvalidInputError(fmt::format(
          "SquadOptimizer.optimize: player {} has non-finite predicted points",
          p.id));
    }
  }
}

// A player is dropped when enough same-position rivals are at least as good
// (more points, or equal points and cheaper, or equal on both and a lower
// id) that, in any squad containing it, one of them is free to swap in:
// rivals from its own club always are; a rival from another club is blocked
// only by being picked already or by its club being full, and at most
// (squad_size - 1) / max_per_club other clubs can be full.
std::vector<Player> drop_dominated(const std::vector<Player> &pool,
                                   const SquadConstraintSet &cons,
                                   double resolution) {
  const std::size_t n = pool.size();
  std::vector<double> pts(n);
  for (std::size_t i = 0; i < n; ++i)
    pts[i] = std::round(pool[i].predicted_points * resolution);
  const int max_full = (cons.squad_size - 1) / cons.max_per_club;

  std::vector<Player> kept;
  kept.reserve(n);
  for (std::size_t b = 0; b < n; ++b) {
    const Player &pb = pool[b];
    const int needed = cons.quota(pb.position) + max_full;
    int same_club = 0;
    std::unordered_set<std::string> other_clubs;
    for (std::size_t a = 0; a < n; ++a) {
      const Player &pa = pool[a];
      if (a == b || pa.position != pb.position)
        continue;
      const bool at_least_as_good = pts[a] >= pts[b] && pa.cost <= pb.cost;
      const bool strictly =
          pts[a] > pts[b] || pa.cost < pb.cost || pa.id < pb.id;
      if (!at_least_as_good || !strictly)
        continue;
      if (pa.club == pb.club)
        ++same_club;
      else
        other_clubs.insert(pa.club);
      if (same_club + static_cast<int>(other_clubs.size()) >= needed)
        break;
    }
    if (same_club + static_cast<int>(other_clubs.size()) < needed)
      kept.push_back(pb);
  }
  return kept;
}

} // namespace

Squad SquadOptimizer::optimize(const std::vector<Player> &players,
                               const SquadConstraintSet &cons) {
  const auto t0 = std::chrono::steady_clock::now();
  stats_ = SearchStats{};

  check_constraints(cons);
  if (!std::isfinite(cfg_.points_resolution) || cfg_.points_resolution <= 0.0) {
    throw InvalidConfigurationError(
        "SquadOptimizer.optimize: points_resolution must be positive");
  }
  if (cfg_.bound_iterations < 0) {
    throw InvalidConfigurationError(
        "SquadOptimizer.optimize: bound_iterations must not be negative");
  }
  check_player_pool(players);

  std::vector<Player> pool = eligible_players(players, cfg_.eligibility);
  std::sort(pool.begin(), pool.end(), [](const Player &a, const Player &b) {
    if (a.position != b.position)
      return position_index(a.position) < position_index(b.position);
    return a.id < b.id;
  });
  stats_.eligible_players = static_cast<int>(pool.size());

  if (static_cast<int>(pool.size()) < cons.squad_size) {
    throw InvalidInputError(fmt::format(
        "SquadOptimizer.optimize: only {} eligible players for a squad of {}",
        pool.size(), cons.squad_size));
  }
  Eigen::ArrayXi per_pos = Eigen::ArrayXi::Zero(kNumPositions);
  for (const auto &p : pool)
    ++per_pos[position_index(p.position)];
  for (int i = 0; i < kNumPositions; ++i) {
    if (per_pos[i] < cons.position_quota[i]) {
      throw InvalidInputError(fmt::format(
          "SquadOptimizer.optimize: {} eligible {} players, quota is {}",
          per_pos[i], position_code(position_from_index(i)),
          cons.position_quota[i]));
    }
  }

  if (cfg_.prune_dominated)
    pool = drop_dominated(pool, cons, cfg_.points_resolution);
  stats_.candidates = static_cast<int>(pool.size());

  BranchAndBound bb(pool, cons, cfg_, stats_, t0);
  Value root = kNeg;
  bool found = false;
  try {
    root = bb.prepare();
    if (root != kNeg) {
      stats_.relaxation_points =
          static_cast<double>(scaled_points(root, bb.multiplier())) /
          cfg_.points_resolution;
      if (cfg_.verbose) {
        fmt::print("[Debug] SquadOptimizer: eligible={} candidates={} "
                   "budget={} bound_iterations={} relaxation_points={:.3f}\n",
                   stats_.eligible_players, stats_.candidates, cons.budget,
                   stats_.bound_iterations, stats_.relaxation_points);
      }
      found = bb.run();
    }
  } catch (const TimeoutError &) {
    stats_.elapsed_ms = elapsed_ms_since(t0);
    if (cfg_.verbose) {
      fmt::print("[Debug] SquadOptimizer: gave up after nodes={} "
                 "elapsed_ms={:.1f}\n",
                 stats_.nodes, stats_.elapsed_ms);
    }
    throw;
  }
  stats_.elapsed_ms = elapsed_ms_since(t0);
  if (root == kNeg) {
    throw InfeasibleError(fmt::format(
        "SquadOptimizer.optimize: no combination filling the position quotas "
        "fits within a budget of {}",
        cons.budget));
  }
  if (cfg_.verbose) {
    fmt::print("[Debug] SquadOptimizer: nodes={} elapsed_ms={:.1f} found={}\n",
               stats_.nodes, stats_.elapsed_ms, found);
  }
  if (!found) {
    throw InfeasibleError(fmt::format(
        "SquadOptimizer.optimize: no squad satisfies the limit of {} players "
        "per club within the budget",
        cons.max_per_club));
  }

  std::vector<Player> chosen;
  chosen.reserve(static_cast<std::size_t>(cons.squad_size));
  for (const std::size_t i : bb.selection())
    chosen.push_back(pool[i]);
  return Squad::from_players(std::move(chosen), cons);
}

Squad optimize(const std::vector<Player> &players,
               const SquadConstraintSet &cons, const OptimizerConfig &cfg) {
  SquadOptimizer opt(cfg);
  return opt.optimize(players, cons);
}

} // namespace fpl_core
