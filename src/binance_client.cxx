#include "defs.h"
#include "market_data.h"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <print>
#include <utility>

using json = nlohmann::json;

namespace xover {

namespace {

std::string get_env_or_default(std::string_view name,
                               std::string_view default_val) {
  if (const auto *val = std::getenv(std::string{name}.c_str()))
    return val;
  return std::string{default_val};
}

// Binance encodes prices as decimal strings
std::expected<double, DataError> parse_price(const json &field) {
  if (not field.is_string())
    return std::unexpected(DataError::ParseError);

  const auto &text = field.get_ref<const std::string &>();
  auto value = 0.0;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);

  if (ec != std::errc{} or ptr != text.data() + text.size() or value <= 0.0)
    return std::unexpected(DataError::ParseError);

  return value;
}

} // namespace

std::expected<std::vector<double>, DataError>
parse_klines(std::string_view body) {
  try {
    const auto klines = json::parse(body);
    if (not klines.is_array())
      return std::unexpected(DataError::ParseError);

    // [open_time, open, high, low, close, volume, ...], oldest first
    auto closes = std::vector<double>{};
    closes.reserve(klines.size());

    for (const auto &kline : klines) {
      if (not kline.is_array() or kline.size() < 5)
        return std::unexpected(DataError::ParseError);

      auto close = parse_price(kline[4]);
      if (not close)
        return std::unexpected(close.error());

      closes.push_back(*close);
    }

    return closes;

  } catch (const json::exception &) {
    return std::unexpected(DataError::ParseError);
  }
}

BinanceClient::BinanceClient(std::string api_key)
    : api_key_{std::move(api_key)},
      base_url_{get_env_or_default("BINANCE_BASE_URL",
                                   "https://api.binance.com")} {}

std::expected<std::vector<double>, DataError>
BinanceClient::recent_prices(std::string_view symbol,
                             std::string_view interval, std::size_t limit) {
  if (limit == 0)
    return std::vector<double>{};

  // Create HTTPS client for the spot market data API
  auto client = httplib::Client{base_url_};
  client.set_connection_timeout(10);
  client.set_read_timeout(30);

  const auto path = std::format("/api/v3/klines?symbol={}&interval={}&limit={}",
                                symbol, interval,
                                std::min(limit, max_klines_per_request));

  // Klines are public; the key only raises the rate limit weight budget
  auto headers = httplib::Headers{};
  if (not api_key_.empty())
    headers.emplace("X-MBX-APIKEY", api_key_);

  auto res = client.Get(path, headers);

  if (not res) {
    std::println(stderr, "  Network error - no response ({})",
                 httplib::to_string(res.error()));
    return std::unexpected(DataError::NetworkError);
  }

  // 418 is Binance's IP ban after ignoring 429s
  if (res->status == 429 or res->status == 418)
    return std::unexpected(DataError::RateLimitError);

  if (res->status != 200) {
    std::println(stderr, "Klines API error: status={}, body={}", res->status,
                 res->body);
    return std::unexpected(DataError::HttpError);
  }

  return parse_klines(res->body);
}

std::expected<double, DataError>
BinanceClient::current_price(std::string_view symbol) {
  // Latest close of the running 1m candle
  auto prices = recent_prices(symbol, "1m", 1);
  if (not prices)
    return std::unexpected(prices.error());

  if (prices->empty())
    return std::unexpected(DataError::NoData);

  return prices->back();
}

} // namespace xover
