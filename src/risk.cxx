#include "risk.h"

namespace xover {

namespace {

RiskDecision close_position(std::optional<Position> &position, double price,
                            double timestamp, ExitReason reason) {
  const auto quantity = position->quantity;
  const auto pnl = realised_pnl(position->entry_price, price, quantity);
  position.reset();

  return {Trade{timestamp, Action::Sell, price, quantity, reason}, pnl};
}

} // namespace

RiskDecision RiskManager::apply(std::optional<Position> &position,
                                Signal signal, double price,
                                double timestamp) const {
  // Open a position, BUY while already holding is ignored
  if (signal == Signal::Buy and not position) {
    const auto quantity = config_.base_asset_amount;
    position = Position{price, quantity, timestamp};
    return {Trade{timestamp, Action::Buy, price, quantity, ExitReason::Entry},
            0.0};
  }

  if (not position)
    return {};

  if (signal == Signal::Sell)
    return close_position(position, price, timestamp, ExitReason::Signal);

  const auto entry = position->entry_price;

  if (is_stop_loss(entry, price, config_.stop_loss_pct))
    return close_position(position, price, timestamp, ExitReason::StopLoss);

  if (is_take_profit(entry, price, config_.take_profit_pct))
    return close_position(position, price, timestamp, ExitReason::TakeProfit);

  return {};
}

} // namespace xover
