#pragma once

#include <string_view>

namespace xover {

// Invalid configuration: fatal at construction, no partial engine is built
enum class ConfigError {
  InvalidWindows,
  InvalidRisk,
  UnknownStrategy,
  FileNotFound,
  ParseError
};

// Market data could not be fetched (recoverable in the live loop)
enum class DataError { NetworkError, RateLimitError, HttpError, ParseError, NoData };

// Rejected lifecycle request
enum class ControlError { AlreadyRunning, NotRunning, StopTimedOut };

constexpr std::string_view to_string(ConfigError error) {
  switch (error) {
  case ConfigError::InvalidWindows:
    return "long_window must be greater than short_window (both positive)";
  case ConfigError::InvalidRisk:
    return "invalid risk parameters";
  case ConfigError::UnknownStrategy:
    return "unknown strategy type";
  case ConfigError::FileNotFound:
    return "config file not found";
  case ConfigError::ParseError:
    return "config file could not be parsed";
  }
  return "unknown config error";
}

constexpr std::string_view to_string(DataError error) {
  switch (error) {
  case DataError::NetworkError:
    return "network error";
  case DataError::RateLimitError:
    return "rate limited";
  case DataError::HttpError:
    return "unexpected HTTP status";
  case DataError::ParseError:
    return "malformed market data";
  case DataError::NoData:
    return "no market data";
  }
  return "unknown data error";
}

constexpr std::string_view to_string(ControlError error) {
  switch (error) {
  case ControlError::AlreadyRunning:
    return "Bot already running";
  case ControlError::NotRunning:
    return "Bot not running";
  case ControlError::StopTimedOut:
    return "Bot did not stop in time";
  }
  return "unknown control error";
}

} // namespace xover
