#pragma once

#include "bot.h"
#include "execution.h"
#include "types.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace xover {

// JSON encodings used by the control surface
void to_json(nlohmann::json &, const Trade &);
void to_json(nlohmann::json &, const BotStatus &);
void to_json(nlohmann::json &, const BacktestResult &);

// HTTP status plus JSON body
struct Reply {
  int status{200};
  nlohmann::json body;
};

// Route handlers, independent of the transport
Reply handle_root();
Reply handle_status(const TradingBot &);
Reply handle_start(TradingBot &);
Reply handle_stop(TradingBot &);
Reply handle_backtest(TradingBot &, std::string_view request_body);

// REST control surface for one bot:
//   GET  /          - liveness message
//   GET  /status    - running flag, open position, trade count
//   POST /start     - start the live loop
//   POST /stop      - stop the live loop
//   POST /backtest  - {"num_candles": N}, replay N recent candles
class ControlServer {
public:
  ControlServer(TradingBot &, std::string host, int port);

  // Blocks until stop() is called or binding fails
  bool run();

  void stop() { server_.stop(); }

private:
  void setup_routes();

  httplib::Server server_;
  TradingBot &bot_;
  std::string host_;
  int port_;
};

} // namespace xover
