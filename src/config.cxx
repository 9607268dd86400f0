#include "config.h"
#include <cstdlib>
#include <print>
#include <string>
#include <yaml-cpp/yaml.h>

namespace xover {

namespace {

std::string get_env_or_default(std::string_view name,
                               std::string_view default_val) {
  if (const auto *val = std::getenv(std::string{name}.c_str()))
    return val;
  return std::string{default_val};
}

// Windows are read signed so that negative values are rejected rather than
// wrapped
std::expected<std::size_t, ConfigError> read_window(const YAML::Node &node,
                                                    std::size_t fallback) {
  if (not node)
    return fallback;

  const auto value = node.as<long long>();
  if (value <= 0)
    return std::unexpected(ConfigError::InvalidWindows);

  return static_cast<std::size_t>(value);
}

std::expected<Config, ConfigError> from_yaml(const YAML::Node &root) {
  auto config = Config{};

  // An empty document is a valid, all-defaults configuration
  if (root.IsNull())
    return config;

  if (not root.IsMap())
    return std::unexpected(ConfigError::ParseError);

  config.api_key = root["api_key"].as<std::string>("");
  config.api_secret = root["api_secret"].as<std::string>("");
  config.symbol = root["symbol"].as<std::string>(config.symbol);
  config.interval = root["interval"].as<std::string>(config.interval);
  config.risk.base_asset_amount =
      root["base_asset_amount"].as<double>(config.risk.base_asset_amount);

  if (const auto risk = root["risk"]) {
    config.risk.stop_loss_pct =
        risk["stop_loss_pct"].as<double>(config.risk.stop_loss_pct);
    config.risk.take_profit_pct =
        risk["take_profit_pct"].as<double>(config.risk.take_profit_pct);
    config.risk.max_position_size =
        risk["max_position_size"].as<double>(config.risk.max_position_size);
  }

  if (const auto strategy = root["strategy"]) {
    config.strategy.type =
        strategy["type"].as<std::string>(config.strategy.type);

    auto short_window =
        read_window(strategy["short_window"], config.strategy.short_window);
    if (not short_window)
      return std::unexpected(short_window.error());

    auto long_window =
        read_window(strategy["long_window"], config.strategy.long_window);
    if (not long_window)
      return std::unexpected(long_window.error());

    config.strategy.short_window = *short_window;
    config.strategy.long_window = *long_window;
  }

  if (const auto engine = root["engine"]) {
    config.tick_interval = std::chrono::milliseconds{
        engine["tick_interval_ms"].as<long long>(config.tick_interval.count())};
    config.stop_timeout = std::chrono::milliseconds{
        engine["stop_timeout_ms"].as<long long>(config.stop_timeout.count())};
  }

  if (const auto server = root["server"]) {
    config.server_host = server["host"].as<std::string>(config.server_host);
    config.server_port = server["port"].as<int>(config.server_port);
  }

  return config;
}

} // namespace

std::expected<Config, ConfigError> parse_config(std::string_view text) {
  try {
    auto config = from_yaml(YAML::Load(std::string{text}));
    if (not config)
      return config;

    if (auto valid = validate(*config); not valid)
      return std::unexpected(valid.error());

    return config;
  } catch (const YAML::Exception &e) {
    std::println(stderr, "❌ Config parse error: {}", e.what());
    return std::unexpected(ConfigError::ParseError);
  }
}

std::expected<Config, ConfigError> load_config(std::string_view path) {
  auto root = YAML::Node{};
  try {
    root = YAML::LoadFile(std::string{path});
  } catch (const YAML::BadFile &) {
    std::println(stderr, "❌ Config file not found: {}", path);
    return std::unexpected(ConfigError::FileNotFound);
  } catch (const YAML::Exception &e) {
    std::println(stderr, "❌ Config parse error in {}: {}", path, e.what());
    return std::unexpected(ConfigError::ParseError);
  }

  auto config = std::expected<Config, ConfigError>{};
  try {
    config = from_yaml(root);
  } catch (const YAML::Exception &e) {
    std::println(stderr, "❌ Config value error in {}: {}", path, e.what());
    return std::unexpected(ConfigError::ParseError);
  }

  if (not config)
    return config;

  // Credentials fall back to the environment
  if (config->api_key.empty())
    config->api_key = get_env_or_default("BINANCE_API_KEY", "");
  if (config->api_secret.empty())
    config->api_secret = get_env_or_default("BINANCE_API_SECRET", "");

  if (auto valid = validate(*config); not valid)
    return std::unexpected(valid.error());

  return config;
}

std::expected<void, ConfigError> validate(const Config &config) {
  const auto &strategy = config.strategy;
  if (strategy.short_window == 0 or strategy.long_window <= strategy.short_window)
    return std::unexpected(ConfigError::InvalidWindows);

  const auto &risk = config.risk;
  const auto is_fraction = [](double pct) { return pct > 0.0 and pct < 1.0; };

  if (risk.base_asset_amount <= 0.0 or not is_fraction(risk.stop_loss_pct) or
      not is_fraction(risk.take_profit_pct) or risk.max_position_size <= 0.0)
    return std::unexpected(ConfigError::InvalidRisk);

  if (config.tick_interval.count() <= 0 or config.stop_timeout.count() <= 0 or
      config.server_port <= 0 or config.server_port > 65535)
    return std::unexpected(ConfigError::ParseError);

  // max_position_size is carried for the control surface but not enforced
  if (risk.base_asset_amount > risk.max_position_size)
    std::println(stderr,
                 "⚠️  base_asset_amount {} exceeds max_position_size {} "
                 "(limit is not enforced)",
                 risk.base_asset_amount, risk.max_position_size);

  return {};
}

} // namespace xover
