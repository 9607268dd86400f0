// Command-line backtest: replays recent candles (or a CSV bar dump) through
// the crossover strategy and risk rules, then prints the ledger and summary.
//
// Usage:
//   xover_backtest [config.yaml] [num_candles]
//   xover_backtest [config.yaml] --csv bars.csv

#include "bot.h"
#include "config.h"
#include "defs.h"
#include "market_data.h"
#include <charconv>
#include <memory>
#include <print>
#include <string_view>
#include <utility>

namespace {

// ANSI colour codes
constexpr auto colour_reset = "\033[0m";
constexpr auto colour_green = "\033[32m";
constexpr auto colour_red = "\033[31m";
constexpr auto colour_cyan = "\033[36m";

void print_ledger(const xover::Ledger &trades) {
  std::println("\n{:-<72}", "");
  std::println("{:>8} {:>6} {:>14} {:>12} {:>14}", "BAR", "SIDE", "PRICE",
               "QTY", "REASON");
  std::println("{:-<72}", "");

  for (const auto &trade : trades) {
    const auto colour =
        trade.action == xover::Action::Buy ? colour_cyan : colour_reset;
    std::println("{}{:>8.0f} {:>6} {:>14.2f} {:>12.6f} {:>14}{}", colour,
                 trade.timestamp, xover::to_string(trade.action), trade.price,
                 trade.quantity, xover::to_string(trade.reason), colour_reset);
  }
}

void print_summary(const xover::BacktestResult &result) {
  std::println("\n{}📊 BACKTEST RESULTS{}", colour_cyan, colour_reset);
  std::println("{:-<72}", "");

  const auto pl_colour = result.profit >= 0.0 ? colour_green : colour_red;

  std::println("Realised P&L:    {}{:+.4f}{}", pl_colour, result.profit,
               colour_reset);
  std::println("Ledger entries:  {}", result.trade_count);
  std::println("Closed trades:   {}", result.closed_trades);
  std::println("Win Rate:        {:.1f}% ({}/{} wins)", result.win_rate(),
               result.winning_trades, result.closed_trades);

  if (result.open_position)
    std::println("Open position:   {:.6f} @ {:.2f} (unrealised, not counted)",
                 result.open_position->quantity,
                 result.open_position->entry_price);
  std::println("");
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  std::println("{}🔬 xover BACKTESTING ENGINE{}", colour_cyan, colour_reset);

  const auto config_path =
      argc > 1 ? std::string_view{argv[1]} : std::string_view{"config/config.yaml"};
  const auto config = xover::load_config(config_path);
  if (not config) {
    std::println(stderr, "❌ {}: {}", config_path,
                 xover::to_string(config.error()));
    return 1;
  }

  auto num_candles = xover::default_backtest_candles;
  auto source = std::shared_ptr<xover::PriceSource>{};

  if (argc > 3 and std::string_view{argv[2]} == "--csv") {
    auto csv = xover::CsvPriceSource::open(argv[3]);
    if (not csv) {
      std::println(stderr, "❌ {}", xover::to_string(csv.error()));
      return 1;
    }
    num_candles = (*csv)->size();
    source = std::move(*csv);
  } else {
    if (argc > 2) {
      const auto arg = std::string_view{argv[2]};
      const auto [ptr, ec] =
          std::from_chars(arg.data(), arg.data() + arg.size(), num_candles);
      if (ec != std::errc{} or ptr != arg.data() + arg.size() or
          num_candles == 0) {
        std::println(stderr, "❌ num_candles must be a positive integer");
        return 1;
      }
    }
    source = xover::make_price_source(*config);
  }

  auto bot = xover::TradingBot::create(*config, source);
  if (not bot) {
    std::println(stderr, "❌ Invalid configuration: {}",
                 xover::to_string(bot.error()));
    return 1;
  }

  std::println("Symbol:    {} ({})", config->symbol, config->interval);
  std::println("Strategy:  {} {}/{}", config->strategy.type,
               config->strategy.short_window, config->strategy.long_window);
  std::println("Candles:   {}", num_candles);

  const auto result = (*bot)->backtest(num_candles);
  if (not result) {
    std::println(stderr, "❌ Backtest failed: {}",
                 xover::to_string(result.error()));
    return 1;
  }

  print_ledger(result->trades);
  print_summary(*result);

  return 0;
}
