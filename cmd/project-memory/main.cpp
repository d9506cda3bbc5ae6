#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/memory_options.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/memory_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using projmem::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults + environment only
  } else if (argc == 2 && std::string(argv[1]) != "--help") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: project-memory [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  std::shared_ptr<projmem::service::ServiceContext> ctx;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? projmem::runtime::config::RuntimeConfig{} : projmem::config::ConfigLoader::LoadFromYaml(config_path);

    projmem::observability::InitializeLogging(config);

    const auto options = projmem::config::ResolveOptions(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    ctx = projmem::factory::Build(options);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<projmem::grpc::MemoryServer>(ctx->handler));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(options.bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PROJMEM_LOG_INFO("Project memory started", {projmem::observability::StringField("bind_address", options.bind_address),
                                                projmem::observability::StringField("db_path", options.db_path),
                                                projmem::observability::BoolField("read_only", options.read_only)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    PROJMEM_LOG_INFO("Shutting down project memory");

    server.Stop();
    ctx->Shutdown();
    projmem::observability::ShutdownLogging();
  } catch (const projmem::util::StorageIntegrity& e) {
    PROJMEM_LOG_ERROR("Storage integrity failure; restore from an export or remove the database file",
                      {projmem::observability::StringField("error", e.what())});
    if (ctx) ctx->Shutdown();
    projmem::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    PROJMEM_LOG_ERROR("Fatal error", {projmem::observability::StringField("error", e.what())});
    if (ctx) ctx->Shutdown();
    projmem::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
