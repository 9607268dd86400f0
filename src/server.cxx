#include "server.h"
#include "defs.h"
#include <format>
#include <print>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace xover {

void to_json(json &j, const Trade &trade) {
  j = json{{"timestamp", trade.timestamp},
           {"action", std::string{to_string(trade.action)}},
           {"price", trade.price},
           {"quantity", trade.quantity},
           {"reason", std::string{to_string(trade.reason)}}};
}

void to_json(json &j, const BotStatus &status) {
  j = json{{"running", status.running},
           {"state", std::string{to_string(status.state)}},
           {"trade_count", status.trade_count},
           {"realised_pnl", status.realised_pnl}};

  // Absent position is an explicit null
  if (status.open_position_price)
    j["open_position"] = *status.open_position_price;
  else
    j["open_position"] = nullptr;
}

void to_json(json &j, const BacktestResult &result) {
  j = json{{"profit", result.profit},
           {"trade_count", result.trade_count},
           {"trades", result.trades},
           {"closed_trades", result.closed_trades},
           {"winning_trades", result.winning_trades},
           {"losing_trades", result.losing_trades},
           {"win_rate", result.win_rate()},
           {"position_open", result.open_position.has_value()}};
}

Reply handle_root() {
  return {200, json{{"message", "TradingBot API running"}}};
}

Reply handle_status(const TradingBot &bot) { return {200, bot.status()}; }

Reply handle_start(TradingBot &bot) {
  if (auto started = bot.start(); not started) {
    const auto status =
        started.error() == ControlError::StopTimedOut ? 500 : 400;
    return {status, json{{"detail", std::string{to_string(started.error())}}}};
  }
  return {200, json{{"message", "Bot started"}}};
}

Reply handle_stop(TradingBot &bot) {
  auto stopped = bot.stop();
  if (stopped)
    return {200, json{{"message", "Bot stopped"}}};

  // The loop was told to exit but is still inside a fetch
  if (stopped.error() == ControlError::StopTimedOut)
    return {500, json{{"detail", std::string{to_string(stopped.error())}}}};

  return {400, json{{"detail", std::string{to_string(stopped.error())}}}};
}

Reply handle_backtest(TradingBot &bot, std::string_view request_body) {
  auto num_candles = default_backtest_candles;

  if (not request_body.empty()) {
    const auto request = json::parse(request_body, nullptr, false);
    if (request.is_discarded() or not request.is_object())
      return {400, json{{"detail", "Request body must be a JSON object"}}};

    if (request.contains("num_candles")) {
      const auto &value = request["num_candles"];
      if (not value.is_number_integer() or value.get<long long>() <= 0 or
          value.get<long long>() >
              static_cast<long long>(max_klines_per_request))
        return {400, json{{"detail",
                           std::format("num_candles must be between 1 and {}",
                                       max_klines_per_request)}}};
      num_candles = value.get<std::size_t>();
    }
  }

  auto result = bot.backtest(num_candles);
  if (not result)
    return {503, json{{"detail", std::format("Market data unavailable: {}",
                                             to_string(result.error()))}}};

  return {200, *result};
}

ControlServer::ControlServer(TradingBot &bot, std::string host, int port)
    : bot_{bot}, host_{std::move(host)}, port_{port} {
  setup_routes();
}

void ControlServer::setup_routes() {
  const auto send = [](httplib::Response &res, const Reply &reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
  };

  server_.Get("/", [send](const httplib::Request &, httplib::Response &res) {
    send(res, handle_root());
  });

  server_.Get("/status",
              [this, send](const httplib::Request &, httplib::Response &res) {
                send(res, handle_status(bot_));
              });

  server_.Post("/start",
               [this, send](const httplib::Request &, httplib::Response &res) {
                 send(res, handle_start(bot_));
               });

  server_.Post("/stop",
               [this, send](const httplib::Request &, httplib::Response &res) {
                 send(res, handle_stop(bot_));
               });

  server_.Post("/backtest", [this, send](const httplib::Request &req,
                                         httplib::Response &res) {
    send(res, handle_backtest(bot_, req.body));
  });
}

bool ControlServer::run() {
  std::println("🌐 Control API listening on {}:{}", host_, port_);
  if (not server_.listen(host_, port_)) {
    std::println(stderr, "❌ Could not bind {}:{}", host_, port_);
    return false;
  }
  return true;
}

} // namespace xover
