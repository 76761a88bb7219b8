#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace bounty::observability {

OtlpConfig ToOtlpConfig(const bounty::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint = observability.otlp_endpoint();
  otlp.transport =
      observability.transport() == bounty::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  if (observability.metrics_interval_ms() > 0) {
    otlp.export_interval_ms = observability.metrics_interval_ms();
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const bool  traces   = signal == OtlpSignal::kTraces;
  const char* specific = std::getenv(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (specific != nullptr && *specific != '\0') {
    return specific;
  }
  if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); shared != nullptr && *shared != '\0') {
    return shared;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace bounty::observability
