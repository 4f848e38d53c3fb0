// =============================================================================
// event_json_test.cpp
// =============================================================================
// Telemetry encoding: every Event alternative maps to a JSON object with a
// "type" discriminator, the cycle id and an epoch-millisecond timestamp.
// =============================================================================

#include "rebal/events/event_json.hpp"
#include "rebal/time/time_utils.hpp"

#include <gtest/gtest.h>

using nlohmann::json;

TEST(EventJsonTest, OrderEvent) {
  rebal::OrderEvent e;
  e.order.symbol = "BTC/USD";
  e.order.side = rebal::domain::Side::Sell;
  e.order.quantity = 0.5;
  e.order.reference_price = 40000.0;
  e.order.notional_usd = 20000.0;
  e.timestamp = rebal::ms_to_timestamp(1700000000123);
  e.sequence_id = 7;

  json j = rebal::toJson(rebal::Event{e});

  EXPECT_EQ(j.at("type"), "order");
  EXPECT_EQ(j.at("cycle"), 7);
  EXPECT_EQ(j.at("timestamp_ms"), 1700000000123);
  EXPECT_EQ(j.at("order").at("side"), "SELL");
  EXPECT_DOUBLE_EQ(j.at("order").at("quantity").get<double>(), 0.5);
}

TEST(EventJsonTest, RiskViolationEvent) {
  rebal::RiskViolationEvent e;
  e.breach = {rebal::domain::RiskRule::SingleAssetExposure, "ETH/USD", 0.4,
              0.35};
  e.sequence_id = 3;

  json j = rebal::toJson(rebal::Event{e});
  EXPECT_EQ(j.at("type"), "risk_violation");
  EXPECT_EQ(j.at("rule"), "SingleAssetExposure");
  EXPECT_EQ(j.at("symbol"), "ETH/USD");
  EXPECT_DOUBLE_EQ(j.at("limit_value").get<double>(), 0.35);
}

TEST(EventJsonTest, ExecutionReportAndFault) {
  rebal::ExecutionReportEvent report;
  report.order.symbol = "SOL/USD";
  report.status = rebal::ExecutionStatus::Rejected;
  report.message = "insufficient SOL";

  json r = rebal::toJson(rebal::Event{report});
  EXPECT_EQ(r.at("type"), "execution_report");
  EXPECT_EQ(r.at("status"), "Rejected");
  EXPECT_EQ(r.at("message"), "insufficient SOL");

  rebal::SymbolFaultEvent fault;
  fault.fault = {"XRP/USD", rebal::domain::FaultKind::ArithmeticFault,
                 "price 0"};
  json f = rebal::toJson(rebal::Event{fault});
  EXPECT_EQ(f.at("type"), "symbol_fault");
  EXPECT_EQ(f.at("kind"), "ArithmeticFault");
}

TEST(EventJsonTest, CycleSummaryFormatsAsParseableText) {
  rebal::CycleSummaryEvent e;
  e.passed = false;
  e.breached_rule = "MaxDrawdown";
  e.approved_orders = 0;
  e.total_equity_usd = 8900.0;
  e.sequence_id = 12;

  const std::string text = rebal::formatTelemetry(rebal::Event{e});
  json j = json::parse(text);
  EXPECT_EQ(j.at("type"), "cycle_summary");
  EXPECT_EQ(j.at("passed"), false);
  EXPECT_EQ(j.at("breached_rule"), "MaxDrawdown");
  EXPECT_EQ(j.at("cycle"), 12);
}
