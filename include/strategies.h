#pragma once

#include "config.h"
#include "errors.h"
#include "types.h"
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace xover {

// Arithmetic mean of the last `periods` prices (0 if not enough data)
double moving_average(std::span<const double>, std::size_t periods);

// Bounded live price history; the oldest price is dropped on overflow
struct PriceHistory {
  std::vector<double> prices;
  std::size_t capacity{};

  explicit PriceHistory(std::size_t cap) : capacity{cap} {
    prices.reserve(cap + 1);
  }

  void add_price(double price) {
    prices.push_back(price);
    if (prices.size() > capacity)
      prices.erase(prices.begin());
  }

  std::span<const double> view() const { return prices; }
};

// Signal capability: consumes the price history (most recent last) and emits
// HOLD/BUY/SELL. Implementations may keep state between calls; one instance
// serves exactly one run.
class SignalStrategy {
public:
  virtual ~SignalStrategy() = default;

  virtual std::string name() const = 0;

  // History length needed before the strategy can emit anything
  virtual std::size_t warmup() const = 0;

  virtual void reset() = 0;

  virtual Signal generate_signal(std::span<const double>) = 0;
};

// Moving-average crossover: BUY when the short average moves above the long
// average, SELL when it moves back below. Equal averages count as below.
class SmaCrossover final : public SignalStrategy {
public:
  enum class CrossState { Unset, Below, Above };

  static std::expected<std::unique_ptr<SmaCrossover>, ConfigError>
  create(std::size_t short_window, std::size_t long_window);

  std::string name() const override { return "sma"; }
  std::size_t warmup() const override { return long_window_; }
  void reset() override { last_cross_state_ = CrossState::Unset; }
  Signal generate_signal(std::span<const double>) override;

  std::size_t short_window() const { return short_window_; }
  std::size_t long_window() const { return long_window_; }
  CrossState last_cross_state() const { return last_cross_state_; }

private:
  SmaCrossover(std::size_t short_window, std::size_t long_window)
      : short_window_{short_window}, long_window_{long_window} {}

  std::size_t short_window_;
  std::size_t long_window_;
  CrossState last_cross_state_{CrossState::Unset};
};

// Build a fresh strategy from the registry of known types
std::expected<std::unique_ptr<SignalStrategy>, ConfigError>
make_strategy(const StrategyConfig &);

// Names accepted by make_strategy
std::vector<std::string> strategy_names();

} // namespace xover
