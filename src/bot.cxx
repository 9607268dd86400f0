#include "bot.h"
#include <cmath>
#include <print>
#include <utility>

namespace xover {

std::expected<std::unique_ptr<TradingBot>, ConfigError>
TradingBot::create(Config config, std::shared_ptr<PriceSource> source) {
  if (auto valid = validate(config); not valid)
    return std::unexpected(valid.error());

  // Fail here rather than on the first start
  if (auto strategy = make_strategy(config.strategy); not strategy)
    return std::unexpected(strategy.error());

  return std::unique_ptr<TradingBot>{
      new TradingBot{std::move(config), std::move(source)}};
}

TradingBot::TradingBot(Config config, std::shared_ptr<PriceSource> source)
    : config_{std::move(config)}, source_{std::move(source)},
      risk_{config_.risk} {}

TradingBot::~TradingBot() {
  // The worker writes into book_, so it must finish before members go away
  worker_.request_stop();
  if (worker_.joinable())
    worker_.join();
}

std::unique_ptr<SignalStrategy> TradingBot::fresh_strategy() const {
  // The strategy config was validated by create() and never changes
  return std::move(*make_strategy(config_.strategy));
}

std::expected<void, ControlError> TradingBot::start() {
  auto lock = std::scoped_lock{control_mutex_};

  if (state_ == RunState::Running)
    return std::unexpected(ControlError::AlreadyRunning);

  // A worker left behind by an unclean stop has already been asked to exit,
  // but may still be inside a fetch
  if (worker_.joinable()) {
    if (worker_done_.valid() and
        worker_done_.wait_for(config_.stop_timeout) ==
            std::future_status::timeout) {
      std::println(stderr,
                   "⚠️  Previous live loop still running - not starting");
      return std::unexpected(ControlError::StopTimedOut);
    }
    worker_.join();
  }

  auto done = std::promise<void>{};
  worker_done_ = done.get_future();

  const auto settings = LiveLoopSettings{config_.symbol, config_.tick_interval};

  // Every session starts with fresh crossover state and an empty history
  worker_ = std::jthread{[this, settings, strategy = fresh_strategy(),
                          done = std::move(done)](
                             std::stop_token stop) mutable {
    auto core = ExecutionCore{*strategy, risk_};
    core.run_live(stop, *source_, settings, book_);
    done.set_value();
  }};

  state_ = RunState::Running;
  std::println("🚀 Bot started ({} {})", config_.symbol, config_.interval);
  return {};
}

std::expected<void, ControlError> TradingBot::stop() {
  auto lock = std::scoped_lock{control_mutex_};

  if (state_ != RunState::Running)
    return std::unexpected(ControlError::NotRunning);

  worker_.request_stop();
  state_ = RunState::Stopped;

  if (worker_done_.wait_for(config_.stop_timeout) ==
      std::future_status::timeout) {
    std::println(stderr,
                 "⚠️  Live loop did not stop within {}ms - forced stop, worker "
                 "will be reaped on next start",
                 config_.stop_timeout.count());
    return std::unexpected(ControlError::StopTimedOut);
  }

  worker_.join();
  std::println("✅ Bot stopped");
  return {};
}

BotStatus TradingBot::status() const {
  auto status = BotStatus{};
  status.state = state_;
  status.running = status.state == RunState::Running;

  auto lock = std::scoped_lock{book_.mutex};
  if (book_.position)
    status.open_position_price = book_.position->entry_price;
  status.trade_count = book_.ledger.size();
  status.realised_pnl = book_.realised_pnl;
  return status;
}

Ledger TradingBot::trades() const {
  auto lock = std::scoped_lock{book_.mutex};
  return book_.ledger;
}

std::expected<BacktestResult, DataError>
TradingBot::backtest(std::size_t num_candles) {
  auto prices =
      source_->recent_prices(config_.symbol, config_.interval, num_candles);

  if (not prices) {
    std::println(stderr, "❌ Backtest aborted: {}", to_string(prices.error()));
    return std::unexpected(prices.error());
  }

  for (const auto price : *prices)
    if (not std::isfinite(price) or price <= 0.0)
      return std::unexpected(DataError::ParseError);

  auto result = replay(*prices);
  std::println("📊 Backtest over {} candles: {} trades, profit {:+.4f}",
               prices->size(), result.trade_count, result.profit);
  return result;
}

BacktestResult TradingBot::replay(std::span<const double> prices) const {
  auto strategy = fresh_strategy();
  auto core = ExecutionCore{*strategy, risk_};
  return core.backtest(prices);
}

} // namespace xover
