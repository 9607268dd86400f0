#pragma once

#include "config.h"
#include "errors.h"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xover {

// Market data capability consumed by the engine. Calls may block on network
// I/O and may fail transiently.
class PriceSource {
public:
  virtual ~PriceSource() = default;

  // Latest price for a symbol
  virtual std::expected<double, DataError> current_price(std::string_view) = 0;

  // Last `limit` close prices, oldest first
  virtual std::expected<std::vector<double>, DataError>
  recent_prices(std::string_view, std::string_view, std::size_t) = 0;
};

// Binance spot klines over REST
class BinanceClient final : public PriceSource {
public:
  explicit BinanceClient(std::string api_key);

  std::expected<double, DataError> current_price(std::string_view) override;

  std::expected<std::vector<double>, DataError>
  recent_prices(std::string_view, std::string_view, std::size_t) override;

private:
  std::string api_key_;
  std::string base_url_;
};

// Random prices around a random base, for running without credentials
class SyntheticPriceSource final : public PriceSource {
public:
  SyntheticPriceSource();
  explicit SyntheticPriceSource(std::uint64_t seed);

  std::expected<double, DataError> current_price(std::string_view) override;

  std::expected<std::vector<double>, DataError>
  recent_prices(std::string_view, std::string_view, std::size_t) override;

private:
  std::mutex mutex_; // Live loop and backtests may draw concurrently
  std::mt19937_64 rng_;
  double last_price_{};
};

// Replays close prices from a timestamp,open,high,low,close,volume CSV
class CsvPriceSource final : public PriceSource {
public:
  static std::expected<std::unique_ptr<CsvPriceSource>, DataError>
  open(std::string_view path);

  explicit CsvPriceSource(std::vector<double> closes)
      : closes_{std::move(closes)} {}

  // Walks forward one row per call and stays on the last row
  std::expected<double, DataError> current_price(std::string_view) override;

  std::expected<std::vector<double>, DataError>
  recent_prices(std::string_view, std::string_view, std::size_t) override;

  std::size_t size() const { return closes_.size(); }

private:
  std::mutex mutex_;
  std::vector<double> closes_;
  std::size_t cursor_{};
};

// Close prices from a Binance /api/v3/klines response body
std::expected<std::vector<double>, DataError> parse_klines(std::string_view);

// Parse close prices from CSV text (header row optional)
std::expected<std::vector<double>, DataError> parse_closes_csv(std::string_view);

// Binance when credentials are configured, otherwise synthetic data
std::unique_ptr<PriceSource> make_price_source(const Config &);

} // namespace xover
