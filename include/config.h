#pragma once

#include "defs.h"
#include "errors.h"
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace xover {

struct StrategyConfig {
  std::string type{default_strategy};
  std::size_t short_window{default_short_window};
  std::size_t long_window{default_long_window};
};

struct RiskConfig {
  double base_asset_amount{default_base_asset_amount};
  double stop_loss_pct{default_stop_loss_pct};
  double take_profit_pct{default_take_profit_pct};
  double max_position_size{default_max_position_size};
};

struct Config {
  std::string api_key;
  std::string api_secret;
  std::string symbol{default_symbol};
  std::string interval{default_interval};
  RiskConfig risk;
  StrategyConfig strategy;

  std::chrono::milliseconds tick_interval{default_tick_interval};
  std::chrono::milliseconds stop_timeout{default_stop_timeout};

  std::string server_host{default_server_host};
  int server_port{default_server_port};

  bool has_credentials() const {
    return not api_key.empty() and not api_secret.empty();
  }
};

// Parse a YAML document; missing keys keep their defaults
std::expected<Config, ConfigError> parse_config(std::string_view);

// Load a YAML file, then fill empty credentials from BINANCE_API_KEY and
// BINANCE_API_SECRET
std::expected<Config, ConfigError> load_config(std::string_view);

// Reject parameters the engine cannot run with
std::expected<void, ConfigError> validate(const Config &);

} // namespace xover
