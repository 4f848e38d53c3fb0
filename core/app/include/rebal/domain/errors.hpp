#pragma once

#include <stdexcept>
#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// Collaborator exceptions
// -----------------------------------------------------------------------------
// The external interfaces (PriceFeed, RuleRegistry, OrderSubmission) report
// failure by throwing. The engine catches them per symbol / per order and
// turns them into domain::SymbolFault values; none of them escapes a cycle.
//
// ConfigError is different: it is thrown while loading configuration or
// exchange rules and is meant to stop start-up.
// -----------------------------------------------------------------------------

class DataUnavailableError : public std::runtime_error {
 public:
  DataUnavailableError(const std::string& symbol, std::size_t requested,
                       std::size_t available)
      : std::runtime_error("insufficient price history for " + symbol +
                           ": requested " + std::to_string(requested) +
                           ", have " + std::to_string(available)),
        symbol_(symbol) {}

  const std::string& symbol() const { return symbol_; }

 private:
  std::string symbol_;
};

class UnknownSymbolError : public std::runtime_error {
 public:
  explicit UnknownSymbolError(const std::string& symbol)
      : std::runtime_error("no asset rule for " + symbol), symbol_(symbol) {}

  const std::string& symbol() const { return symbol_; }

 private:
  std::string symbol_;
};

class ExecutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace rebal
