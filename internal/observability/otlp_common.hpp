#pragma once

#ifdef ENABLE_OTEL

#include <cstdlib>
#include <string>

#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace negotiation::observability::detail {

constexpr const char* kServiceName    = "negotiation-manager";
constexpr const char* kServiceVersion = "0.1.0";

inline bool UseHttp(const negotiation::runtime::config::ObservabilityConfig& config) {
  return config.transport() == negotiation::runtime::config::OTLP_TRANSPORT_HTTP;
}

// config endpoint, then the signal specific OTEL_* variable, then the generic one
inline std::string ResolveEndpoint(const negotiation::runtime::config::ObservabilityConfig& config, const char* signal_env,
                                   const char* http_path) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return UseHttp(config) ? std::string("http://localhost:4318") + http_path : std::string("localhost:4317");
}

inline opentelemetry::sdk::resource::Resource BuildResource() {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", kServiceName}, {"service.version", kServiceVersion}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace negotiation::observability::detail

#endif
