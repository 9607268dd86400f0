#pragma once

#include "config.h"
#include "types.h"
#include <optional>

namespace xover {

// Check if stop loss is triggered (touching the threshold counts)
constexpr bool is_stop_loss(double entry_price, double current_price,
                            double sl_pct) {
  return current_price <= entry_price * (1.0 - sl_pct);
}

// Check if take profit is triggered (touching the threshold counts)
constexpr bool is_take_profit(double entry_price, double current_price,
                              double tp_pct) {
  return current_price >= entry_price * (1.0 + tp_pct);
}

// Realised profit of closing `quantity` bought at `entry_price`
constexpr double realised_pnl(double entry_price, double exit_price,
                              double quantity) {
  return (exit_price - entry_price) * quantity;
}

static_assert(is_stop_loss(100.0, 97.9, 0.02), "2% SL: 97.9 closes");
static_assert(not is_stop_loss(100.0, 98.5, 0.02), "2% SL: 98.5 holds");
static_assert(is_take_profit(100.0, 103.5, 0.03), "3% TP: 103.5 closes");
static_assert(not is_take_profit(100.0, 102.5, 0.03), "3% TP: 102.5 holds");
static_assert(realised_pnl(100.0, 110.0, 1.0) == 10.0, "+10 on one unit");
static_assert(realised_pnl(100.0, 90.0, 2.0) == -20.0, "-10 on two units");

// Outcome of one tick: at most one trade
struct RiskDecision {
  std::optional<Trade> trade;
  double realised_pnl{};
};

// Turns signals into trades under a single-position policy with stop-loss and
// take-profit exits
class RiskManager {
public:
  explicit RiskManager(const RiskConfig &config) : config_{config} {}

  // Updates `position` in place. Signal exits are evaluated before thresholds
  // and a position closed by the signal is not checked again.
  RiskDecision apply(std::optional<Position> &position, Signal signal,
                     double price, double timestamp) const;

  const RiskConfig &config() const { return config_; }

private:
  RiskConfig config_;
};

} // namespace xover
