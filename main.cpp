// -----------------------------------------------------------------------------
// momentum_rebalancer: paper-trading entry point.
//
//   1) Load EngineConfig (argv[1], default config/engine.json) and the
//      exchange-info rule table it points at.
//   2) Build the collaborators: PriceHistoryStore (price feed), PaperAccount
//      (account + order sink), LiveTimeProvider.
//   3) Build the RebalanceEngine and bridge its events to the IpcServer PUB
//      socket; operator commands arrive on the REP socket.
//   4) Run the MarketDataGateway on its own thread, feeding the store.
//   5) Run one cycle every cycle_interval_seconds on the main thread until
//      Ctrl-C.
//
// Thread layout:
//   main thread        → cycle loop
//   market data thread → MarketDataGateway::run()
//   IPC thread         → IpcServer (commands serialize on the engine mutex)
// -----------------------------------------------------------------------------

#include "rebal/config/config_loader.hpp"
#include "rebal/domain/errors.hpp"
#include "rebal/domain/portfolio_state.hpp"
#include "rebal/engine/rebalance_engine.hpp"
#include "rebal/events/event.hpp"
#include "rebal/execution/paper_account.hpp"
#include "rebal/gateway/market_data_gateway.hpp"
#include "rebal/market/price_history_store.hpp"
#include "rebal/network/ipc_server.hpp"
#include "rebal/rules/json_rule_registry.hpp"
#include "rebal/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// Set once by main() before the handler is installed; read by the handler.
static rebal::MarketDataGateway* g_gateway_ptr = nullptr;
static std::atomic<bool> g_stop{false};

static void sigint_handler(int /*signum*/) {
  g_stop.store(true);
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : std::string("config/engine.json");

  rebal::EngineConfig config;
  try {
    config = rebal::loadConfigFile(config_path);
  } catch (const rebal::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  if (config.harness.symbols.empty()) {
    std::cerr << "[main] No symbols configured in " << config_path << "\n";
    return 1;
  }

  try {
    const rebal::JsonRuleRegistry rules =
        rebal::JsonRuleRegistry::fromFile(config.harness.exchange_info_path);

    rebal::PriceHistoryStore prices(config.harness.price_history_capacity);
    rebal::LiveTimeProvider clock;
    rebal::PaperAccount account(prices, config.harness.symbols,
                                config.harness.initial_cash,
                                config.harness.cash_asset);

    rebal::RebalanceEngine engine(
        config, prices, account, account, rules, clock,
        rebal::domain::PortfolioState::fromInitialCash(
            config.harness.initial_cash));

    // -------------------------------------------------------------------------
    // Operator surface. Telemetry is pushed from the cycle thread; the
    // IpcServer thread formats and publishes it.
    // -------------------------------------------------------------------------
    rebal::IpcServer ipc(
        [&engine](const std::string& cmd) {
          return engine.executeCommand(cmd);
        },
        config.harness.ipc_cmd_endpoint, config.harness.ipc_pub_endpoint);
    engine.eventBus().subscribe(
        [&ipc](const rebal::Event& e) { ipc.pushTelemetry(e); });
    ipc.start();

    rebal::MarketDataGateway gateway(
        [&prices](const rebal::PriceTick& tick) {
          if (!prices.record(tick.symbol, tick.point)) {
            std::cerr << "[main] Out-of-order tick for " << tick.symbol
                      << " dropped.\n";
          }
        },
        config.harness.market_data_endpoint);

    g_gateway_ptr = &gateway;
    std::signal(SIGINT, sigint_handler);

    std::thread market_data_thread([&gateway] { gateway.run(); });

    std::cout << "[main] Rebalancing " << config.harness.symbols.size()
              << " symbol(s) every " << config.harness.cycle_interval_seconds
              << "s. Press Ctrl-C to shut down.\n";

    const auto interval =
        std::chrono::seconds(config.harness.cycle_interval_seconds);
    while (!g_stop.load()) {
      engine.runCycle();

      const auto next = std::chrono::steady_clock::now() + interval;
      while (!g_stop.load() && std::chrono::steady_clock::now() < next) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
    }

    std::cout << "[main] Shutting down...\n";
    gateway.stop();
    market_data_thread.join();
    g_gateway_ptr = nullptr;
    ipc.stop();
  } catch (const rebal::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
