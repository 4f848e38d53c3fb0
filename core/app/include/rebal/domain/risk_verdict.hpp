#pragma once

#include <string>
#include <vector>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// RiskRule: identifiers for every gate the RiskGovernor can fail
// -----------------------------------------------------------------------------
// Declaration order is evaluation order. None means "no breach".
// -----------------------------------------------------------------------------
enum class RiskRule {
  None,
  OperatorHalt,
  InvalidEquity,
  MaxDrawdown,
  SingleAssetExposure,
  DailyLoss,
};

inline const char* toString(RiskRule rule) {
  switch (rule) {
    case RiskRule::None:                return "None";
    case RiskRule::OperatorHalt:        return "OperatorHalt";
    case RiskRule::InvalidEquity:       return "InvalidEquity";
    case RiskRule::MaxDrawdown:         return "MaxDrawdown";
    case RiskRule::SingleAssetExposure: return "SingleAssetExposure";
    case RiskRule::DailyLoss:           return "DailyLoss";
  }
  return "Unknown";
}

// One failed gate. symbol is empty for portfolio-wide rules.
struct RiskBreach {
  RiskRule rule{RiskRule::None};
  std::string symbol;
  double current_value{0.0};
  double limit_value{0.0};
};

// -----------------------------------------------------------------------------
// RiskVerdict: outcome of one RiskGovernor evaluation
// -----------------------------------------------------------------------------
//
// @details
// Every gate is evaluated on every cycle, so breaches lists all of them in
// evaluation order. breached names the first one, which is what the
// operator sees in the log line. passed is true only when breaches is
// empty.
//
// drawdown_fraction and peak_equity are reported even on a passing cycle.
// -----------------------------------------------------------------------------
struct RiskVerdict {
  bool passed{true};
  RiskRule breached{RiskRule::None};
  std::vector<RiskBreach> breaches;
  double drawdown_fraction{0.0};
  double peak_equity{0.0};
};

}  // namespace domain
}  // namespace rebal
