#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace stockcount::observability {
namespace {

constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// item names and error messages carry spaces; keep key=value parseable
std::string Quoted(std::string_view value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string_view::npos) {
    return std::string(value);
  }
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), Quoted(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const stockcount::runtime::config::RuntimeConfig& config) {
  const std::string name = config.session().device_id().empty() ? "stockcount" : config.session().device_id();

  // stderr keeps stdout free for command output
  spdlog::drop(name);
  auto logger = spdlog::stderr_color_mt(name);
  logger->set_pattern(FromEnvOr("STOCKCOUNT_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("STOCKCOUNT_LOG_LEVEL", config.logging().level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }
  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    line += field.value;
  }
  logger->log(level, "{}", line);
}

} // namespace stockcount::observability
