#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/money.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace bounty::observability {
namespace {

// Environment overrides config; config overrides the fallback.
std::string EnvOr(const char* env, const std::string& configured, std::string_view fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool IsTruthy(std::string_view value) {
  return value == "1" || value == "true" || value == "yes";
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (field.value.find_first_of(" \t\"=") == std::string::npos) {
      out << field.value;
    } else {
      out << std::quoted(field.value);
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField MoneyField(std::string_view key, std::int64_t cents) {
  return {std::string(key), util::FormatUsd(cents)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const bounty::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("bounty-ledger");
  if (!logger) {
    logger = spdlog::stdout_color_mt("bounty-ledger");
  }
  const auto& logging = config.logging();
  logger->set_pattern(EnvOr("BOUNTY_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(EnvOr("BOUNTY_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const char* include_trace = std::getenv("BOUNTY_LOG_INCLUDE_TRACE_CONTEXT");
  g_include_trace_context   = include_trace != nullptr ? IsTruthy(include_trace) : logging.include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& part : {SerializeFields(fields), TraceContextFields()}) {
    if (!part.empty()) {
      line.append(1, ' ').append(part);
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace bounty::observability
