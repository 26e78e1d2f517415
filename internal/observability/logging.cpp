#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "flowlock/config/v1/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace flowlock::observability {
namespace {

constexpr std::string_view kDefaultLevel   = "info";
constexpr std::string_view kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_ids{false};

// environment, then config, then fallback
std::string Setting(const char* env, const std::string& configured, std::string_view fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool TraceIdsWanted(const flowlock::config::v1::RuntimeConfig& config) {
  if (const char* value = std::getenv("FLOWLOCK_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string_view flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

// Lock keys and error texts carry spaces and '=': quote those values so a
// line still splits into unambiguous key=value pairs.
void AppendField(std::string& line, const LogField& field) {
  line += ' ';
  line += field.key;
  line += '=';
  if (!field.value.empty() && field.value.find_first_of(" \t\r\n=\"") == std::string::npos) {
    line += field.value;
    return;
  }
  line += '"';
  for (const char c : field.value) {
    if (c == '"' || c == '\\') {
      line += '\\';
      line += c;
    } else if (c == '\n' || c == '\r') {
      line += ' ';
    } else {
      line += c;
    }
  }
  line += '"';
}

void AppendTraceIds(std::string& line) {
#ifdef ENABLE_OTEL
  const auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }
  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line.append(" trace_id=").append(trace_id, sizeof(trace_id));
  line.append(" span_id=").append(span_id, sizeof(span_id));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UIntField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const flowlock::config::v1::RuntimeConfig& config) {
  // safe to call again; the previous logger is replaced
  spdlog::drop("flowlock");
  auto logger = spdlog::stderr_color_mt("flowlock");
  logger->set_pattern(Setting("FLOWLOCK_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("FLOWLOCK_LOG_LEVEL", config.logging().level(), kDefaultLevel)));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_trace_ids = TraceIdsWanted(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  if (g_trace_ids.load(std::memory_order_relaxed)) {
    AppendTraceIds(line);
  }
  logger->log(level, "{}", line);
}

} // namespace flowlock::observability
