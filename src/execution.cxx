#include "execution.h"
#include "defs.h"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <print>

namespace xover {

namespace {

double wall_clock_seconds() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

std::size_t history_capacity(const SignalStrategy &strategy) {
  return std::max(min_history_capacity, 2 * strategy.warmup());
}

BacktestResult ExecutionCore::backtest(std::span<const double> prices) {
  auto result = BacktestResult{};
  auto position = std::optional<Position>{};

  for (auto idx = 0uz; idx < prices.size(); ++idx) {
    const auto price = prices[idx];
    const auto signal = evaluate(prices.first(idx + 1));
    const auto decision =
        apply(position, signal, price, static_cast<double>(idx));

    if (not decision.trade)
      continue;

    result.trades.push_back(*decision.trade);

    if (decision.trade->action == Action::Sell) {
      result.profit += decision.realised_pnl;
      ++result.closed_trades;
      if (decision.realised_pnl > 0.0)
        ++result.winning_trades;
      else if (decision.realised_pnl < 0.0)
        ++result.losing_trades;
    }
  }

  result.trade_count = result.trades.size();
  result.open_position = position;
  return result;
}

void ExecutionCore::run_live(std::stop_token stop, PriceSource &source,
                             const LiveLoopSettings &settings, LiveBook &book) {
  auto history = PriceHistory{history_capacity(strategy_)};

  // Interruptible sleep between ticks
  auto wait_mutex = std::mutex{};
  auto wake = std::condition_variable_any{};

  std::println("🔄 Live loop started for {} ({} strategy, tick {}ms)",
               settings.symbol, strategy_.name(),
               settings.tick_interval.count());

  while (not stop.stop_requested()) {
    if (auto price = source.current_price(settings.symbol);
        price and std::isfinite(*price) and *price > 0.0) {
      history.add_price(*price);
      const auto signal = evaluate(history.view());
      const auto timestamp = wall_clock_seconds();

      auto lock = std::scoped_lock{book.mutex};
      const auto decision = apply(book.position, signal, *price, timestamp);

      if (decision.trade) {
        book.ledger.push_back(*decision.trade);
        book.realised_pnl += decision.realised_pnl;

        const auto &trade = *decision.trade;
        if (trade.action == Action::Buy)
          std::println("📥 BUY {} {} @ {:.2f}", trade.quantity,
                       settings.symbol, trade.price);
        else
          std::println("{} SELL {} {} @ {:.2f} ({}) P&L {:+.4f}",
                       decision.realised_pnl > 0.0 ? "💰" : "🛑",
                       trade.quantity, settings.symbol, trade.price,
                       to_string(trade.reason), decision.realised_pnl);
      }
    } else if (not price) {
      std::println(stderr, "⚠️  Price fetch failed ({}) - skipping tick",
                   to_string(price.error()));
    } else {
      std::println(stderr, "⚠️  Invalid price {} - skipping tick", *price);
    }

    auto lock = std::unique_lock{wait_mutex};
    wake.wait_for(lock, stop, settings.tick_interval, [] { return false; });
  }

  std::println("🛑 Live loop stopped for {}", settings.symbol);
}

} // namespace xover
