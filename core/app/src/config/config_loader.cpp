#include "rebal/config/config_loader.hpp"
#include "rebal/domain/errors.hpp"

#include <fstream>
#include <sstream>

namespace rebal {

namespace {

// Fraction in (0, 1].
void requireFraction(double value, const char* name) {
  if (!(value > 0.0 && value <= 1.0)) {
    std::ostringstream os;
    os << name << " must be in (0, 1], got " << value;
    throw ConfigError(os.str());
  }
}

void requirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    std::ostringstream os;
    os << name << " must be positive, got " << value;
    throw ConfigError(os.str());
  }
}

void requireNonNegative(double value, const char* name) {
  if (!(value >= 0.0)) {
    std::ostringstream os;
    os << name << " must be non-negative, got " << value;
    throw ConfigError(os.str());
  }
}

void readSizing(const nlohmann::json& j, SizingConfig& out) {
  out.usd_per_unit_return =
      j.value("usd_per_unit_return", out.usd_per_unit_return);
  out.sell_floor_fraction =
      j.value("sell_floor_fraction", out.sell_floor_fraction);
  if (j.contains("sell_floor_basis")) {
    out.sell_floor_basis =
        parseSellFloorBasis(j.at("sell_floor_basis").get<std::string>());
  }
  out.cash_buffer_fraction =
      j.value("cash_buffer_fraction", out.cash_buffer_fraction);
  out.clip_to_exposure_limit =
      j.value("clip_to_exposure_limit", out.clip_to_exposure_limit);
}

void readNormalizer(const nlohmann::json& j, NormalizerConfig& out) {
  out.min_trade_usd = j.value("min_trade_usd", out.min_trade_usd);
}

void readRisk(const nlohmann::json& j, domain::RiskLimits& out) {
  out.max_drawdown_fraction =
      j.value("max_drawdown_fraction", out.max_drawdown_fraction);
  out.max_single_asset_fraction =
      j.value("max_single_asset_fraction", out.max_single_asset_fraction);
  out.max_daily_loss_fraction =
      j.value("max_daily_loss_fraction", out.max_daily_loss_fraction);
  out.calibrate_peak_on_start =
      j.value("calibrate_peak_on_start", out.calibrate_peak_on_start);
}

void readHarness(const nlohmann::json& j, HarnessConfig& out) {
  if (j.contains("symbols")) {
    out.symbols = j.at("symbols").get<std::vector<std::string>>();
  }
  out.initial_cash = j.value("initial_cash", out.initial_cash);
  out.cash_asset = j.value("cash_asset", out.cash_asset);
  out.cycle_interval_seconds =
      j.value("cycle_interval_seconds", out.cycle_interval_seconds);
  out.price_history_capacity =
      j.value("price_history_capacity", out.price_history_capacity);
  out.exchange_info_path =
      j.value("exchange_info_path", out.exchange_info_path);
  out.market_data_endpoint =
      j.value("market_data_endpoint", out.market_data_endpoint);
  out.ipc_cmd_endpoint = j.value("ipc_cmd_endpoint", out.ipc_cmd_endpoint);
  out.ipc_pub_endpoint = j.value("ipc_pub_endpoint", out.ipc_pub_endpoint);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseSellFloorBasis
// -----------------------------------------------------------------------------
SellFloorBasis parseSellFloorBasis(const std::string& text) {
  if (text == "available_cash") {
    return SellFloorBasis::AvailableCash;
  }
  if (text == "current_exposure") {
    return SellFloorBasis::CurrentExposure;
  }
  throw ConfigError("unknown sell_floor_basis: " + text);
}

// -----------------------------------------------------------------------------
// parseConfig: overlay the document on the defaults, then validate
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  EngineConfig config;

  // value() and get<>() throw nlohmann::json::type_error when a key holds the
  // wrong type. Surface that as a ConfigError naming the offending input.
  try {
    if (document.contains("sizing")) {
      readSizing(document.at("sizing"), config.sizing);
    }
    if (document.contains("normalizer")) {
      readNormalizer(document.at("normalizer"), config.normalizer);
    }
    if (document.contains("risk")) {
      readRisk(document.at("risk"), config.risk);
    }
    if (document.contains("harness")) {
      readHarness(document.at("harness"), config.harness);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  validateConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadConfigFile
// -----------------------------------------------------------------------------
EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }

  return parseConfig(document);
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& config) {
  requirePositive(config.sizing.usd_per_unit_return, "usd_per_unit_return");
  requireNonNegative(config.sizing.sell_floor_fraction, "sell_floor_fraction");
  if (config.sizing.sell_floor_fraction > 1.0) {
    throw ConfigError("sell_floor_fraction must not exceed 1");
  }
  requireFraction(config.sizing.cash_buffer_fraction, "cash_buffer_fraction");

  requireNonNegative(config.normalizer.min_trade_usd, "min_trade_usd");

  requireFraction(config.risk.max_drawdown_fraction, "max_drawdown_fraction");
  requireFraction(config.risk.max_single_asset_fraction,
                  "max_single_asset_fraction");
  requireFraction(config.risk.max_daily_loss_fraction,
                  "max_daily_loss_fraction");

  requireNonNegative(config.harness.initial_cash, "initial_cash");
  if (config.harness.cycle_interval_seconds <= 0) {
    throw ConfigError("cycle_interval_seconds must be positive");
  }
  // Momentum needs the two most recent points.
  if (config.harness.price_history_capacity < 2) {
    throw ConfigError("price_history_capacity must be at least 2");
  }
}

}  // namespace rebal
