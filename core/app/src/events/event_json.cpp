#include "rebal/events/event_json.hpp"
#include "rebal/time/time_utils.hpp"

#include <type_traits>

namespace rebal {

// -----------------------------------------------------------------------------
// toJson(NormalizedOrder)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::NormalizedOrder& order) {
  nlohmann::json j;
  j["symbol"] = order.symbol;
  j["side"] = domain::toString(order.side);
  j["quantity"] = order.quantity;
  j["reference_price"] = order.reference_price;
  j["notional_usd"] = order.notional_usd;
  return j;
}

// -----------------------------------------------------------------------------
// toJson(Event): one branch per variant alternative
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        j["cycle"] = e.sequence_id;
        j["timestamp_ms"] = timestamp_to_ms(e.timestamp);

        if constexpr (std::is_same_v<T, SymbolFaultEvent>) {
          j["type"] = "symbol_fault";
          j["symbol"] = e.fault.symbol;
          j["kind"] = domain::toString(e.fault.kind);
          j["detail"] = e.fault.detail;
        } else if constexpr (std::is_same_v<T, RiskViolationEvent>) {
          j["type"] = "risk_violation";
          j["rule"] = domain::toString(e.breach.rule);
          j["symbol"] = e.breach.symbol;
          j["current_value"] = e.breach.current_value;
          j["limit_value"] = e.breach.limit_value;
        } else if constexpr (std::is_same_v<T, OrderEvent>) {
          j["type"] = "order";
          j["order"] = toJson(e.order);
        } else if constexpr (std::is_same_v<T, ExecutionReportEvent>) {
          j["type"] = "execution_report";
          j["order"] = toJson(e.order);
          j["status"] = toString(e.status);
          j["message"] = e.message;
        } else if constexpr (std::is_same_v<T, CycleSummaryEvent>) {
          j["type"] = "cycle_summary";
          j["passed"] = e.passed;
          j["aborted"] = e.aborted;
          j["breached_rule"] = e.breached_rule;
          j["approved_orders"] = e.approved_orders;
          j["rejected_orders"] = e.rejected_orders;
          j["faults"] = e.faults;
          j["total_equity_usd"] = e.total_equity_usd;
          j["peak_equity_usd"] = e.peak_equity_usd;
          j["daily_pnl_usd"] = e.daily_pnl_usd;
        } else {
          static_assert(!sizeof(T), "unhandled Event alternative");
        }
        return j;
      },
      event);
}

// -----------------------------------------------------------------------------
// formatTelemetry
// -----------------------------------------------------------------------------
std::string formatTelemetry(const Event& event) { return toJson(event).dump(); }

}  // namespace rebal
