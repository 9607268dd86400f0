// Unit tests for the crossover signal engine and strategy registry
#include "strategies.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <vector>

using Catch::Matchers::WithinRel;
using namespace xover;

namespace {

// Feed a series bar by bar, as the live loop does
std::vector<Signal> run_series(SignalStrategy &strategy,
                               const std::vector<double> &prices) {
  auto signals = std::vector<Signal>{};
  for (auto i = 1uz; i <= prices.size(); ++i)
    signals.push_back(
        strategy.generate_signal(std::span<const double>{prices}.first(i)));
  return signals;
}

} // namespace

TEST_CASE("Moving average uses the most recent prices", "[strategies]") {
  const auto prices = std::vector<double>{100.0, 102.0, 104.0, 106.0, 108.0};

  REQUIRE_THAT(moving_average(prices, 5), WithinRel(104.0, 1e-12));
  REQUIRE_THAT(moving_average(prices, 2), WithinRel(107.0, 1e-12));
  REQUIRE(moving_average(prices, 6) == 0.0);
  REQUIRE(moving_average(prices, 0) == 0.0);
}

TEST_CASE("SMA crossover rejects invalid windows", "[strategies]") {
  SECTION("Long window must exceed short window") {
    auto strategy = SmaCrossover::create(5, 5);
    REQUIRE_FALSE(strategy);
    REQUIRE(strategy.error() == ConfigError::InvalidWindows);
  }

  SECTION("Short window must be positive") {
    auto strategy = SmaCrossover::create(0, 5);
    REQUIRE_FALSE(strategy);
    REQUIRE(strategy.error() == ConfigError::InvalidWindows);
  }

  SECTION("Valid windows build a strategy") {
    auto strategy = SmaCrossover::create(7, 25);
    REQUIRE(strategy);
    REQUIRE((*strategy)->warmup() == 25);
  }
}

TEST_CASE("Insufficient history always holds", "[strategies]") {
  auto strategy = std::move(*SmaCrossover::create(3, 5));
  const auto prices = std::vector<double>{100.0, 200.0, 50.0, 300.0};

  for (auto i = 0uz; i <= prices.size(); ++i) {
    REQUIRE(strategy->generate_signal(
                std::span<const double>{prices}.first(i)) == Signal::Hold);
    REQUIRE(strategy->last_cross_state() == SmaCrossover::CrossState::Unset);
  }
}

TEST_CASE("Crossover emits one BUY then one SELL", "[strategies]") {
  auto strategy = std::move(*SmaCrossover::create(2, 3));

  SECTION("First determinable bar only records state") {
    // Equal averages count as below
    const auto prices = std::vector<double>{10.0, 10.0, 10.0};
    REQUIRE(run_series(*strategy, prices) ==
            std::vector{Signal::Hold, Signal::Hold, Signal::Hold});
    REQUIRE(strategy->last_cross_state() == SmaCrossover::CrossState::Below);
  }

  SECTION("Cross up then cross down") {
    const auto prices =
        std::vector<double>{10.0, 10.0, 10.0, 13.0, 13.0, 7.0, 7.0};
    const auto signals = run_series(*strategy, prices);

    REQUIRE(signals == std::vector{Signal::Hold, Signal::Hold, Signal::Hold,
                                   Signal::Buy, Signal::Hold, Signal::Sell,
                                   Signal::Hold});
  }

  SECTION("Starting above does not emit a BUY") {
    const auto prices = std::vector<double>{10.0, 11.0, 12.0, 13.0};
    const auto signals = run_series(*strategy, prices);

    REQUIRE(std::ranges::count(signals, Signal::Buy) == 0);
    REQUIRE(strategy->last_cross_state() == SmaCrossover::CrossState::Above);
  }

  SECTION("Reset forgets the previous run") {
    const auto prices = std::vector<double>{10.0, 11.0, 12.0};
    run_series(*strategy, prices);
    REQUIRE(strategy->last_cross_state() == SmaCrossover::CrossState::Above);

    strategy->reset();
    REQUIRE(strategy->last_cross_state() == SmaCrossover::CrossState::Unset);
  }
}

TEST_CASE("Strategy registry builds strategies by name", "[strategies]") {
  SECTION("sma is registered") {
    auto strategy = make_strategy(StrategyConfig{"sma", 7, 25});
    REQUIRE(strategy);
    REQUIRE((*strategy)->name() == "sma");
    REQUIRE((*strategy)->warmup() == 25);
  }

  SECTION("Unknown names are rejected") {
    auto strategy = make_strategy(StrategyConfig{"rsi", 7, 25});
    REQUIRE_FALSE(strategy);
    REQUIRE(strategy.error() == ConfigError::UnknownStrategy);
  }

  SECTION("Invalid windows surface through the registry") {
    auto strategy = make_strategy(StrategyConfig{"sma", 25, 7});
    REQUIRE_FALSE(strategy);
    REQUIRE(strategy.error() == ConfigError::InvalidWindows);
  }

  SECTION("Registry lists its names") {
    REQUIRE(strategy_names() == std::vector<std::string>{"sma"});
  }
}

TEST_CASE("PriceHistory drops the oldest price on overflow", "[strategies]") {
  auto history = PriceHistory{3};
  for (auto price : {1.0, 2.0, 3.0, 4.0, 5.0})
    history.add_price(price);

  REQUIRE(history.prices == std::vector<double>{3.0, 4.0, 5.0});
  REQUIRE(history.view().size() == 3);
}
