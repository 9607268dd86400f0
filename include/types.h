#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace xover {

enum class Signal { Hold, Buy, Sell };

enum class Action { Buy, Sell };

// Why a trade was recorded
enum class ExitReason { Entry, Signal, StopLoss, TakeProfit };

// Executed (simulated) trade. Timestamp is wall-clock seconds in live mode and
// the candle index in backtests.
struct Trade {
  double timestamp{};
  Action action{Action::Buy};
  double price{};
  double quantity{};
  ExitReason reason{ExitReason::Entry};

  bool operator==(const Trade &) const = default;
};

// The single open position
struct Position {
  double entry_price{};
  double quantity{};
  double entry_timestamp{};
};

using Ledger = std::vector<Trade>;

constexpr std::string_view to_string(Signal signal) {
  switch (signal) {
  case Signal::Buy:
    return "BUY";
  case Signal::Sell:
    return "SELL";
  case Signal::Hold:
    return "HOLD";
  }
  return "HOLD";
}

constexpr std::string_view to_string(Action action) {
  return action == Action::Buy ? "BUY" : "SELL";
}

constexpr std::string_view to_string(ExitReason reason) {
  switch (reason) {
  case ExitReason::Entry:
    return "entry";
  case ExitReason::Signal:
    return "signal";
  case ExitReason::StopLoss:
    return "stop_loss";
  case ExitReason::TakeProfit:
    return "take_profit";
  }
  return "entry";
}

} // namespace xover
