#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace model_vault {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs a stderr logger so stdout stays free for command output.
// MODEL_VAULT_LOG_LEVEL overrides level.
void init_logging(const std::string &level);

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message,
                      std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message,
                      std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::err, message, fields);
}

} // namespace model_vault

#define MV_LOG_DEBUG(message, ...) ::model_vault::log_debug((message), ##__VA_ARGS__)
#define MV_LOG_INFO(message, ...) ::model_vault::log_info((message), ##__VA_ARGS__)
#define MV_LOG_WARN(message, ...) ::model_vault::log_warn((message), ##__VA_ARGS__)
#define MV_LOG_ERROR(message, ...) ::model_vault::log_error((message), ##__VA_ARGS__)
