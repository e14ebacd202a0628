#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/shop_manager.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/context.hpp"

using shopstore::observability::IntField;
using shopstore::observability::StringField;
using shopstore::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: shopstore <config.yaml> OR shopstore --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shopstore::config::ConfigLoader::LoadFromYaml(config_path);

    shopstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = shopstore::factory::Build(config);

    const auto report = app.manager->Connect(shopstore::util::Context::Background());
    if (!report.failures.empty()) {
      SHOPSTORE_LOG_WARN("some shop stores did not reconnect; repair them through the admin service",
                         {IntField("failed", static_cast<int64_t>(report.failures.size()))});
    }

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<shopstore::grpc::CatalogServer>(app.catalog_service));
    services.push_back(std::make_unique<shopstore::grpc::AdminServer>(app.admin_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SHOPSTORE_LOG_INFO("shopstore started", {StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SHOPSTORE_LOG_INFO("Shutting down shopstore");

    server.Stop();
    app.manager->Close();
    shopstore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SHOPSTORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    shopstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
