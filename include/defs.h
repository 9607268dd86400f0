#pragma once

#include <chrono>
#include <cstddef>

namespace xover {

// Market defaults (overridden by config/config.yaml)
constexpr auto default_symbol = "BTCUSDT";
constexpr auto default_interval = "1m";
constexpr auto default_base_asset_amount = 0.001; // Fixed size of every entry

// Exit parameters (TP 3%, SL 2%)
constexpr auto default_take_profit_pct = 0.03;
constexpr auto default_stop_loss_pct = 0.02;
constexpr auto default_max_position_size = 0.1; // Read but not enforced

// Crossover strategy
constexpr auto default_strategy = "sma";
constexpr auto default_short_window = 7uz;
constexpr auto default_long_window = 25uz;

// Live loop timing
constexpr auto default_tick_interval = std::chrono::milliseconds{5000};
constexpr auto default_stop_timeout = std::chrono::milliseconds{5000};

// Live price history is capped at max(min_history_capacity, 2 * long window)
constexpr auto min_history_capacity = 1000uz;

// Backtest
constexpr auto default_backtest_candles = 500uz;
constexpr auto max_klines_per_request = 1000uz; // Binance REST limit

// Control surface
constexpr auto default_server_host = "0.0.0.0";
constexpr auto default_server_port = 8000;

// Compile-time safety checks
static_assert(default_base_asset_amount > 0.0, "Trade size must be positive");
static_assert(default_base_asset_amount <= default_max_position_size,
              "Default trade size should fit within the position limit");
static_assert(default_stop_loss_pct > 0.0 and default_stop_loss_pct < 1.0,
              "Stop loss must be a fraction in (0, 1)");
static_assert(default_take_profit_pct > 0.0 and default_take_profit_pct < 1.0,
              "Take profit must be a fraction in (0, 1)");
static_assert(default_take_profit_pct >= default_stop_loss_pct,
              "Take profit should be >= stop loss");
static_assert(default_short_window > 0, "Short window must be positive");
static_assert(default_long_window > default_short_window,
              "Long window must be longer than short window");
static_assert(min_history_capacity >= 2 * default_long_window,
              "History must hold at least two long windows by default");
static_assert(default_tick_interval >= std::chrono::seconds{1},
              "Tick interval too short - exchange rate limits");
static_assert(default_stop_timeout >= default_tick_interval,
              "Stop timeout should cover at least one tick");
static_assert(default_backtest_candles <= max_klines_per_request,
              "Default backtest exceeds a single klines request");
static_assert(default_server_port > 0 and default_server_port < 65536,
              "Server port out of range");

} // namespace xover
