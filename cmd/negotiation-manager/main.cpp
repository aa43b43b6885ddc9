#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/connector.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  negotiation::observability::ShutdownLogging();
  negotiation::observability::ShutdownMetrics();
  negotiation::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: negotiation-manager <config.yaml> OR negotiation-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = negotiation::config::ConfigLoader::LoadFromYaml(config_path);

    negotiation::observability::InitializeTracing(config);
    negotiation::observability::InitializeMetrics(config);
    negotiation::observability::InitializeLogging(config);

    negotiation::runtime::Connector connector(negotiation::factory::Build(config));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    connector.Start();
    NEGOTIATION_LOG_INFO("negotiation manager running", {negotiation::observability::StringField("address", config.connector().address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    NEGOTIATION_LOG_INFO("shutting down negotiation manager");
    connector.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    NEGOTIATION_LOG_ERROR("fatal error", {negotiation::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
