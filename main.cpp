// -----------------------------------------------------------------------------
// seatwise_server: single executable entry point.
//
//   seatwise_server [config.json]
//
//   1) Load EngineConfig (defaults when no path is given).
//   2) Pick the catalog: JsonCatalogSource when catalog_path is set,
//      otherwise the built-in SampleCatalogSource.
//   3) Create the RegistrarEngine, attach logging subscribers, start it.
//   4) Sleep until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread   -> startup, wait loop, shutdown
//   ipc thread    -> IpcServer (commands + telemetry), owned by the engine
//
// Exit status: 0 after a clean shutdown, 1 when startup fails.
// -----------------------------------------------------------------------------

#include "seatwise/catalog/i_catalog_source.hpp"
#include "seatwise/catalog/json_catalog_source.hpp"
#include "seatwise/config/config_loader.hpp"
#include "seatwise/engine/registrar_engine.hpp"
#include "seatwise/events/event_types.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

// Set by the signal handler, polled by main(). Lock-free atomic<bool> is
// safe to store from a handler.
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [config.json]\n";
    return 1;
  }

  try {
    // -------------------------------------------------------------------------
    // 1) Configuration
    // -------------------------------------------------------------------------
    seatwise::EngineConfig config;
    if (argc == 2) {
      config = seatwise::loadEngineConfig(argv[1]);
      std::cout << "[main] Loaded config from " << argv[1] << "\n";
    }

    // -------------------------------------------------------------------------
    // 2) Catalog
    // -------------------------------------------------------------------------
    std::unique_ptr<seatwise::ICatalogSource> catalog;
    if (!config.catalog_path.empty()) {
      catalog = std::make_unique<seatwise::JsonCatalogSource>(
          seatwise::JsonCatalogSource::fromFile(config.catalog_path));
      std::cout << "[main] Using catalog " << config.catalog_path << "\n";
    } else {
      catalog = std::make_unique<seatwise::SampleCatalogSource>();
      std::cout << "[main] No catalog_path configured; using sample catalog\n";
    }

    // -------------------------------------------------------------------------
    // 3) Engine + logging subscribers (attached before start so nothing is
    //    missed once requests arrive)
    // -------------------------------------------------------------------------
    seatwise::RegistrarEngine engine(config);

    engine.eventBus().subscribe<seatwise::EnrollmentUpdateEvent>(
        [](const seatwise::EnrollmentUpdateEvent& e) {
          std::cout << "[EnrollmentUpdate] id=" << e.enrollment.id
                    << " student=" << e.enrollment.student_id
                    << " section=" << e.enrollment.section_id << " status="
                    << seatwise::domain::toString(e.enrollment.status);
          if (e.previous_status) {
            std::cout << " previous="
                      << seatwise::domain::toString(*e.previous_status);
          }
          std::cout << "\n";
        });

    engine.eventBus().subscribe<seatwise::EnrollmentRejectedEvent>(
        [](const seatwise::EnrollmentRejectedEvent& e) {
          std::cout << "[EnrollmentRejected] student=" << e.student_id
                    << " section=" << e.section_id << " reason=" << e.reason
                    << "\n";
        });

    engine.start(catalog.get());

    // -------------------------------------------------------------------------
    // 4) Wait for a shutdown signal
    // -------------------------------------------------------------------------
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    std::cout << "[main] Press Ctrl-C to shut down.\n";
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] Startup failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
