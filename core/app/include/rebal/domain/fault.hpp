#pragma once

#include <string>
#include <variant>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// FaultKind
// -----------------------------------------------------------------------------
// Per-symbol failure classes. None of them is fatal: a faulted symbol is
// skipped for the current cycle and every other symbol proceeds.
//
//   DataUnavailable  fewer than two price points for the symbol
//   UnknownSymbol    no AssetRule for the symbol
//   ArithmeticFault  zero, negative or non-finite price in a division
//   ExecutionError   the OrderSubmission collaborator rejected the order
// -----------------------------------------------------------------------------
enum class FaultKind {
  DataUnavailable,
  UnknownSymbol,
  ArithmeticFault,
  ExecutionError,
};

inline const char* toString(FaultKind kind) {
  switch (kind) {
    case FaultKind::DataUnavailable: return "DataUnavailable";
    case FaultKind::UnknownSymbol:   return "UnknownSymbol";
    case FaultKind::ArithmeticFault: return "ArithmeticFault";
    case FaultKind::ExecutionError:  return "ExecutionError";
  }
  return "Unknown";
}

struct SymbolFault {
  std::string symbol;
  FaultKind kind{FaultKind::DataUnavailable};
  std::string detail;
};

// -----------------------------------------------------------------------------
// SymbolResult<T>
// -----------------------------------------------------------------------------
// Either the per-symbol value or the fault that prevented it. The cycle
// driver collects these and drops the faults after logging, so one bad
// symbol never unwinds the loop over the others.
// -----------------------------------------------------------------------------
template <typename T>
using SymbolResult = std::variant<T, SymbolFault>;

}  // namespace domain
}  // namespace rebal
