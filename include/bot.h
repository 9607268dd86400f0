#pragma once

#include "config.h"
#include "errors.h"
#include "execution.h"
#include "market_data.h"
#include "risk.h"
#include "strategies.h"
#include <atomic>
#include <cstddef>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <thread>

namespace xover {

enum class RunState { Idle, Running, Stopped };

constexpr std::string_view to_string(RunState state) {
  switch (state) {
  case RunState::Idle:
    return "idle";
  case RunState::Running:
    return "running";
  case RunState::Stopped:
    return "stopped";
  }
  return "idle";
}

struct BotStatus {
  bool running{};
  std::optional<double> open_position_price;
  std::size_t trade_count{};
  RunState state{RunState::Idle};
  double realised_pnl{};
};

// Owns the live worker and the live book. Backtests run on the caller's
// thread with their own strategy instance and never touch the live book.
class TradingBot {
public:
  static std::expected<std::unique_ptr<TradingBot>, ConfigError>
  create(Config, std::shared_ptr<PriceSource>);

  ~TradingBot();

  TradingBot(const TradingBot &) = delete;
  TradingBot &operator=(const TradingBot &) = delete;

  // Idle/Stopped -> Running. Rejected while already running.
  std::expected<void, ControlError> start();

  // Running -> Stopped, waiting at most stop_timeout for the worker
  std::expected<void, ControlError> stop();

  BotStatus status() const;

  // Fetch `num_candles` closes and replay them
  std::expected<BacktestResult, DataError> backtest(std::size_t num_candles);

  // Replay a caller-supplied series
  BacktestResult replay(std::span<const double> prices) const;

  // Copy of the live ledger
  Ledger trades() const;

  const Config &config() const { return config_; }

private:
  TradingBot(Config, std::shared_ptr<PriceSource>);

  std::unique_ptr<SignalStrategy> fresh_strategy() const;

  Config config_;
  std::shared_ptr<PriceSource> source_;
  RiskManager risk_;

  std::mutex control_mutex_; // Serialises start/stop
  std::atomic<RunState> state_{RunState::Idle};
  std::jthread worker_;
  std::future<void> worker_done_;

  LiveBook book_;
};

} // namespace xover
