// Unit tests for the single-position risk rules
#include "risk.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using Catch::Matchers::WithinRel;
using namespace xover;

namespace {

RiskConfig default_risk() {
  auto config = RiskConfig{};
  config.base_asset_amount = 1.0;
  config.stop_loss_pct = 0.02;
  config.take_profit_pct = 0.03;
  return config;
}

} // namespace

TEST_CASE("BUY opens exactly one position", "[risk]") {
  const auto risk = RiskManager{default_risk()};
  auto position = std::optional<Position>{};

  auto first = risk.apply(position, Signal::Buy, 100.0, 0.0);
  REQUIRE(first.trade);
  REQUIRE(first.trade->action == Action::Buy);
  REQUIRE(first.trade->reason == ExitReason::Entry);
  REQUIRE(position);
  REQUIRE(position->entry_price == 100.0);
  REQUIRE(position->quantity == 1.0);

  SECTION("A second BUY while open is ignored") {
    auto second = risk.apply(position, Signal::Buy, 101.0, 1.0);
    REQUIRE_FALSE(second.trade);
    REQUIRE(position->entry_price == 100.0);
  }
}

TEST_CASE("Signals without a position do nothing", "[risk]") {
  const auto risk = RiskManager{default_risk()};
  auto position = std::optional<Position>{};

  REQUIRE_FALSE(risk.apply(position, Signal::Sell, 100.0, 0.0).trade);
  REQUIRE_FALSE(risk.apply(position, Signal::Hold, 100.0, 1.0).trade);
  REQUIRE_FALSE(position);
}

TEST_CASE("Stop-loss and take-profit thresholds", "[risk]") {
  const auto risk = RiskManager{default_risk()};
  auto position = std::optional<Position>{};
  risk.apply(position, Signal::Buy, 100.0, 0.0);

  SECTION("98.5 is above the 2% stop") {
    REQUIRE_FALSE(risk.apply(position, Signal::Hold, 98.5, 1.0).trade);
    REQUIRE(position);
  }

  SECTION("97.9 closes at the stop") {
    const auto decision = risk.apply(position, Signal::Hold, 97.9, 1.0);
    REQUIRE(decision.trade);
    REQUIRE(decision.trade->action == Action::Sell);
    REQUIRE(decision.trade->price == 97.9);
    REQUIRE(decision.trade->reason == ExitReason::StopLoss);
    REQUIRE_THAT(decision.realised_pnl, WithinRel(-2.1, 1e-9));
    REQUIRE_FALSE(position);
  }

  SECTION("102.5 is below the 3% target") {
    REQUIRE_FALSE(risk.apply(position, Signal::Hold, 102.5, 1.0).trade);
    REQUIRE(position);
  }

  SECTION("103.5 closes at the target") {
    const auto decision = risk.apply(position, Signal::Hold, 103.5, 1.0);
    REQUIRE(decision.trade);
    REQUIRE(decision.trade->reason == ExitReason::TakeProfit);
    REQUIRE_THAT(decision.realised_pnl, WithinRel(3.5, 1e-9));
    REQUIRE_FALSE(position);
  }

  SECTION("A BUY signal below the stop still exits") {
    const auto decision = risk.apply(position, Signal::Buy, 97.0, 1.0);
    REQUIRE(decision.trade);
    REQUIRE(decision.trade->action == Action::Sell);
    REQUIRE(decision.trade->reason == ExitReason::StopLoss);
  }
}

TEST_CASE("A SELL signal closes before thresholds are checked", "[risk]") {
  const auto risk = RiskManager{default_risk()};
  auto position = std::optional<Position>{};
  risk.apply(position, Signal::Buy, 100.0, 0.0);

  // Below the stop, but the signal wins and only one SELL is recorded
  const auto decision = risk.apply(position, Signal::Sell, 97.0, 1.0);
  REQUIRE(decision.trade);
  REQUIRE(decision.trade->reason == ExitReason::Signal);
  REQUIRE_THAT(decision.realised_pnl, WithinRel(-3.0, 1e-9));
  REQUIRE_FALSE(position);

  REQUIRE_FALSE(risk.apply(position, Signal::Hold, 97.0, 2.0).trade);
}

TEST_CASE("Realised P&L scales with quantity", "[risk]") {
  auto config = default_risk();
  config.base_asset_amount = 0.5;
  const auto risk = RiskManager{config};
  auto position = std::optional<Position>{};

  risk.apply(position, Signal::Buy, 200.0, 0.0);
  const auto decision = risk.apply(position, Signal::Sell, 202.0, 1.0);

  REQUIRE(decision.trade->quantity == 0.5);
  REQUIRE_THAT(decision.realised_pnl, WithinRel(1.0, 1e-9));
}
