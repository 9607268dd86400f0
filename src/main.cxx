// xover - SMA crossover trading bot with a REST control surface
//
// Usage:
//   xover                       # config/config.yaml
//   xover path/to/config.yaml
//
// Endpoints: GET /, GET /status, POST /start, POST /stop, POST /backtest

#include "bot.h"
#include "config.h"
#include "market_data.h"
#include "server.h"
#include <chrono>
#include <atomic>
#include <csignal>
#include <memory>
#include <print>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Cleared by the signal handler or by the server thread
std::atomic<bool> g_running{true};
static_assert(std::atomic<bool>::is_always_lock_free);

void signal_handler(int) { g_running = false; }

} // namespace

int main(int argc, char *argv[]) {
  std::println("🚀 xover - SMA Crossover Trader");

  const auto config_path = argc > 1 ? argv[1] : "config/config.yaml";
  const auto config = xover::load_config(config_path);
  if (not config) {
    std::println(stderr, "❌ {}: {}", config_path,
                 xover::to_string(config.error()));
    return 1;
  }

  std::println("  Symbol:      {} ({})", config->symbol, config->interval);
  std::println("  Strategy:    {} {}/{}", config->strategy.type,
               config->strategy.short_window, config->strategy.long_window);
  std::println("  Order size:  {}", config->risk.base_asset_amount);
  std::println("  SL / TP:     {:.2f}% / {:.2f}%",
               config->risk.stop_loss_pct * 100.0,
               config->risk.take_profit_pct * 100.0);

  auto source = std::shared_ptr<xover::PriceSource>{
      xover::make_price_source(*config)};

  // Construction errors abort startup, there is no partial engine
  auto bot = xover::TradingBot::create(*config, source);
  if (not bot) {
    std::println(stderr, "❌ Invalid configuration: {}",
                 xover::to_string(bot.error()));
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto server = xover::ControlServer{**bot, config->server_host,
                                     config->server_port};

  auto server_thread = std::jthread{[&server] {
    if (not server.run())
      g_running = false;
  }};

  while (g_running)
    std::this_thread::sleep_for(200ms);

  std::println("\n🔄 Shutting down...");
  server.stop();

  if (auto stopped = (*bot)->stop();
      not stopped and stopped.error() == xover::ControlError::StopTimedOut) {
    std::println(stderr, "⚠️  {}", xover::to_string(stopped.error()));
    return 1;
  }

  std::println("✅ Shutdown complete");
  return 0;
}
