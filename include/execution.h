#pragma once

#include "market_data.h"
#include "risk.h"
#include "strategies.h"
#include "types.h"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace xover {

// Live position, ledger and realised P&L shared between the worker (the only
// writer) and status readers
struct LiveBook {
  mutable std::mutex mutex;
  std::optional<Position> position;
  Ledger ledger;
  double realised_pnl{};
};

struct BacktestResult {
  double profit{};           // Realised only, an open position counts 0
  std::size_t trade_count{}; // BUY and SELL entries in the ledger
  Ledger trades;

  // Break-even closes count towards closed_trades only
  std::size_t closed_trades{};
  std::size_t winning_trades{};
  std::size_t losing_trades{};
  std::optional<Position> open_position;

  double win_rate() const {
    return closed_trades > 0
               ? (static_cast<double>(winning_trades) / closed_trades) * 100.0
               : 0.0;
  }
};

struct LiveLoopSettings {
  std::string symbol;
  std::chrono::milliseconds tick_interval{};
};

// Live history cap: max(1000, 2 * warmup)
std::size_t history_capacity(const SignalStrategy &);

// One decision step shared by the live loop and the backtest
class ExecutionCore {
public:
  ExecutionCore(SignalStrategy &strategy, const RiskManager &risk)
      : strategy_{strategy}, risk_{risk} {}

  Signal evaluate(std::span<const double> history) {
    return strategy_.generate_signal(history);
  }

  RiskDecision apply(std::optional<Position> &position, Signal signal,
                     double price, double timestamp) const {
    return risk_.apply(position, signal, price, timestamp);
  }

  // Replays `prices` bar by bar, each tick seeing the prefix up to and
  // including the current bar. Trades are stamped with the bar index.
  BacktestResult backtest(std::span<const double> prices);

  // Fetch, decide, record, wait; until stop is requested. Fetch failures skip
  // the tick and never end the loop.
  void run_live(std::stop_token, PriceSource &, const LiveLoopSettings &,
                LiveBook &);

private:
  SignalStrategy &strategy_;
  const RiskManager &risk_;
};

} // namespace xover
