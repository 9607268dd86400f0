#include "strategies.h"
#include <functional>
#include <map>
#include <numeric>
#include <utility>

namespace xover {

namespace {

using StrategyFactory =
    std::function<std::expected<std::unique_ptr<SignalStrategy>, ConfigError>(
        const StrategyConfig &)>;

// Strategy constructors keyed by config name
const std::map<std::string, StrategyFactory> &registry() {
  static const auto factories = std::map<std::string, StrategyFactory>{
      {"sma",
       [](const StrategyConfig &config)
           -> std::expected<std::unique_ptr<SignalStrategy>, ConfigError> {
         auto strategy =
             SmaCrossover::create(config.short_window, config.long_window);
         if (not strategy)
           return std::unexpected(strategy.error());
         return std::unique_ptr<SignalStrategy>{std::move(*strategy)};
       }},
  };
  return factories;
}

} // namespace

double moving_average(std::span<const double> prices, std::size_t periods) {
  if (periods == 0 or prices.size() < periods)
    return 0.0;

  const auto window = prices.last(periods);
  return std::accumulate(window.begin(), window.end(), 0.0) /
         static_cast<double>(periods);
}

std::expected<std::unique_ptr<SmaCrossover>, ConfigError>
SmaCrossover::create(std::size_t short_window, std::size_t long_window) {
  if (short_window == 0 or long_window <= short_window)
    return std::unexpected(ConfigError::InvalidWindows);

  return std::unique_ptr<SmaCrossover>{
      new SmaCrossover{short_window, long_window}};
}

Signal SmaCrossover::generate_signal(std::span<const double> prices) {
  // Not enough data for both averages
  if (prices.size() < long_window_)
    return Signal::Hold;

  const auto short_ma = moving_average(prices, short_window_);
  const auto long_ma = moving_average(prices, long_window_);

  const auto current_state =
      short_ma > long_ma ? CrossState::Above : CrossState::Below;

  auto signal = Signal::Hold;
  if (last_cross_state_ == CrossState::Below and
      current_state == CrossState::Above)
    signal = Signal::Buy;
  else if (last_cross_state_ == CrossState::Above and
           current_state == CrossState::Below)
    signal = Signal::Sell;

  last_cross_state_ = current_state;
  return signal;
}

std::expected<std::unique_ptr<SignalStrategy>, ConfigError>
make_strategy(const StrategyConfig &config) {
  const auto &factories = registry();
  const auto it = factories.find(config.type);
  if (it == factories.end())
    return std::unexpected(ConfigError::UnknownStrategy);

  return it->second(config);
}

std::vector<std::string> strategy_names() {
  auto names = std::vector<std::string>{};
  for (const auto &[name, factory] : registry())
    names.push_back(name);
  return names;
}

} // namespace xover
