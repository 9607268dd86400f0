// Offline price sources: CSV replay and synthetic data
#include "market_data.h"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace xover;

TEST_CASE("CSV closes are parsed", "[market_data]") {
  SECTION("Kline dump with a header row") {
    const auto closes = parse_closes_csv(
        "timestamp,open,high,low,close,volume\n"
        "1700000000,100,105,99,101.5,12\n"
        "1700000060,101.5,103,100,102.25,8\n");
    REQUIRE(closes);
    REQUIRE(*closes == std::vector<double>{101.5, 102.25});
  }

  SECTION("Bare column of closes") {
    const auto closes = parse_closes_csv("100\n101\n\n102\n");
    REQUIRE(closes);
    REQUIRE(*closes == std::vector<double>{100.0, 101.0, 102.0});
  }

  SECTION("Bad value after the first row") {
    const auto closes = parse_closes_csv("close\n100\nabc\n");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }

  SECTION("Non-positive price") {
    const auto closes = parse_closes_csv("100\n-5\n");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }

  SECTION("No rows") {
    const auto closes = parse_closes_csv("close\n");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::NoData);
  }
}

TEST_CASE("CSV source replays bars in order", "[market_data]") {
  auto source = CsvPriceSource{{100.0, 101.0, 102.0}};

  REQUIRE(*source.current_price("BTCUSDT") == 100.0);
  REQUIRE(*source.current_price("BTCUSDT") == 101.0);
  REQUIRE(*source.current_price("BTCUSDT") == 102.0);

  // Stays on the last bar
  REQUIRE(*source.current_price("BTCUSDT") == 102.0);

  const auto recent = source.recent_prices("BTCUSDT", "1m", 2);
  REQUIRE(recent);
  REQUIRE(*recent == std::vector<double>{101.0, 102.0});

  const auto all = source.recent_prices("BTCUSDT", "1m", 500);
  REQUIRE(all->size() == 3);
}

TEST_CASE("Missing CSV file", "[market_data]") {
  const auto source = CsvPriceSource::open("/nonexistent/xover/bars.csv");
  REQUIRE_FALSE(source);
  REQUIRE(source.error() == DataError::NoData);
}

TEST_CASE("Synthetic prices", "[market_data]") {
  auto source = SyntheticPriceSource{7};

  SECTION("Recent prices have the requested length and stay positive") {
    const auto prices = source.recent_prices("BTCUSDT", "1m", 500);
    REQUIRE(prices);
    REQUIRE(prices->size() == 500);
    REQUIRE(std::ranges::all_of(*prices, [](double p) { return p > 0.0; }));
  }

  SECTION("Seeded sources agree") {
    auto twin = SyntheticPriceSource{7};
    REQUIRE(*source.recent_prices("BTCUSDT", "1m", 50) ==
            *twin.recent_prices("BTCUSDT", "1m", 50));
  }

  SECTION("Live prices start in range and walk") {
    const auto first = source.current_price("BTCUSDT");
    REQUIRE(first);
    REQUIRE(*first >= 10000.0);
    REQUIRE(*first <= 40000.0);

    for (auto i = 0; i < 100; ++i)
      REQUIRE(*source.current_price("BTCUSDT") > 0.0);
  }
}

TEST_CASE("Binance kline bodies", "[market_data]") {
  SECTION("Closes are read from the fifth field") {
    const auto closes = parse_klines(
        R"([[1700000000000,"100.0","105.0","99.0","101.50","12.3",1700000059999],
            [1700000060000,"101.5","103.0","100.0","102.25","8.1",1700000119999]])");
    REQUIRE(closes);
    REQUIRE(*closes == std::vector<double>{101.5, 102.25});
  }

  SECTION("Empty array") {
    const auto closes = parse_klines("[]");
    REQUIRE(closes);
    REQUIRE(closes->empty());
  }

  SECTION("Numeric close instead of a decimal string") {
    const auto closes =
        parse_klines(R"([[1700000000000,"100.0","105.0","99.0",101.5,"12.3"]])");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }

  SECTION("Kline with fewer than five fields") {
    const auto closes = parse_klines(R"([[1700000000000,"100.0","105.0"]])");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }

  SECTION("Error object instead of an array") {
    const auto closes =
        parse_klines(R"({"code":-1121,"msg":"Invalid symbol."})");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }

  SECTION("Not JSON") {
    const auto closes = parse_klines("<html>502 Bad Gateway</html>");
    REQUIRE_FALSE(closes);
    REQUIRE(closes.error() == DataError::ParseError);
  }
}
