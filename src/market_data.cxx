#include "market_data.h"
#include <algorithm>
#include <charconv>
#include <cstddef>
#include <fstream>
#include <optional>
#include <print>
#include <sstream>

namespace xover {

namespace {

// Relative standard deviation of synthetic prices around their base
constexpr auto synthetic_noise = 0.01;
constexpr auto synthetic_min_base = 10000.0;
constexpr auto synthetic_max_base = 40000.0;

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos)
    return {};
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

std::optional<double> to_double(std::string_view text) {
  text = trim(text);
  auto value = 0.0;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() or ec != std::errc{} or ptr != text.data() + text.size())
    return std::nullopt;
  return value;
}

std::vector<std::string_view> split_fields(std::string_view line) {
  auto fields = std::vector<std::string_view>{};
  auto start = 0uz;
  while (true) {
    const auto comma = line.find(',', start);
    fields.push_back(line.substr(start, comma - start));
    if (comma == std::string_view::npos)
      break;
    start = comma + 1;
  }
  return fields;
}

} // namespace

// Synthetic

SyntheticPriceSource::SyntheticPriceSource()
    : rng_{std::random_device{}()} {}

SyntheticPriceSource::SyntheticPriceSource(std::uint64_t seed) : rng_{seed} {}

std::expected<std::vector<double>, DataError>
SyntheticPriceSource::recent_prices(std::string_view, std::string_view,
                                    std::size_t limit) {
  auto lock = std::scoped_lock{mutex_};

  auto base_dist = std::uniform_real_distribution<double>{synthetic_min_base,
                                                          synthetic_max_base};
  const auto base = base_dist(rng_);
  auto noise = std::normal_distribution<double>{0.0, base * synthetic_noise};

  auto prices = std::vector<double>{};
  prices.reserve(limit);
  for (auto i = 0uz; i < limit; ++i)
    prices.push_back(base + noise(rng_));

  return prices;
}

std::expected<double, DataError>
SyntheticPriceSource::current_price(std::string_view) {
  auto lock = std::scoped_lock{mutex_};

  // Random walk from a random starting level
  if (last_price_ <= 0.0) {
    auto base_dist = std::uniform_real_distribution<double>{
        synthetic_min_base, synthetic_max_base};
    last_price_ = base_dist(rng_);
    return last_price_;
  }

  auto step = std::normal_distribution<double>{0.0,
                                               last_price_ * synthetic_noise};
  last_price_ = std::max(1.0, last_price_ + step(rng_));
  return last_price_;
}

// CSV replay

std::expected<std::vector<double>, DataError>
parse_closes_csv(std::string_view text) {
  auto closes = std::vector<double>{};
  auto stream = std::istringstream{std::string{text}};
  auto line = std::string{};
  auto first_row = true;

  while (std::getline(stream, line)) {
    if (trim(line).empty())
      continue;

    const auto fields = split_fields(line);

    // Dumps carry timestamp,open,high,low,close,volume; a bare column is a
    // list of closes
    const auto column = fields.size() >= 5 ? 4uz : 0uz;
    const auto close = to_double(fields[column]);

    if (not close) {
      // Header row
      if (first_row) {
        first_row = false;
        continue;
      }
      return std::unexpected(DataError::ParseError);
    }

    first_row = false;
    if (*close <= 0.0)
      return std::unexpected(DataError::ParseError);

    closes.push_back(*close);
  }

  if (closes.empty())
    return std::unexpected(DataError::NoData);

  return closes;
}

std::expected<std::unique_ptr<CsvPriceSource>, DataError>
CsvPriceSource::open(std::string_view path) {
  auto file = std::ifstream{std::string{path}};
  if (not file) {
    std::println(stderr, "❌ Cannot open price file: {}", path);
    return std::unexpected(DataError::NoData);
  }

  auto buffer = std::ostringstream{};
  buffer << file.rdbuf();

  auto closes = parse_closes_csv(buffer.str());
  if (not closes)
    return std::unexpected(closes.error());

  std::println("  📊 Loaded {} closes from {}", closes->size(), path);
  return std::make_unique<CsvPriceSource>(std::move(*closes));
}

std::expected<double, DataError>
CsvPriceSource::current_price(std::string_view) {
  auto lock = std::scoped_lock{mutex_};
  if (closes_.empty())
    return std::unexpected(DataError::NoData);

  const auto price = closes_[cursor_];
  if (cursor_ + 1 < closes_.size())
    ++cursor_;
  return price;
}

std::expected<std::vector<double>, DataError>
CsvPriceSource::recent_prices(std::string_view, std::string_view,
                              std::size_t limit) {
  auto lock = std::scoped_lock{mutex_};
  if (closes_.empty())
    return std::unexpected(DataError::NoData);

  const auto count = std::min(limit, closes_.size());
  return std::vector<double>(closes_.end() - static_cast<std::ptrdiff_t>(count),
                             closes_.end());
}

std::unique_ptr<PriceSource> make_price_source(const Config &config) {
  if (config.has_credentials()) {
    std::println("📡 Using Binance market data for {}", config.symbol);
    return std::make_unique<BinanceClient>(config.api_key);
  }

  std::println("⚠️  No Binance credentials - using synthetic prices");
  return std::make_unique<SyntheticPriceSource>();
}

} // namespace xover
