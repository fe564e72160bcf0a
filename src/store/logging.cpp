#include "model_vault/logging.hpp"

#include <cstdlib>
#include <sstream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace model_vault {
namespace {
constexpr const char *kLoggerName = "model_vault";

std::string serialize_fields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto &field : fields) {
    if (!first)
      out << ' ';
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}
} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void init_logging(const std::string &level) {
  std::string resolved = level.empty() ? "info" : level;
  if (const char *env = std::getenv("MODEL_VAULT_LOG_LEVEL"))
    resolved = env;
  auto logger = spdlog::get(kLoggerName);
  if (!logger)
    logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");
  logger->set_level(spdlog::level::from_str(resolved));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto serialized = serialize_fields(fields);
  if (serialized.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized);
}

} // namespace model_vault
