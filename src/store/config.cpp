#include "model_vault/config.hpp"

#include "model_vault/blob_io.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <exception>

namespace model_vault {
namespace {
constexpr double kMaxTtlHours = 24.0 * 365.0;

bool take_string(const nlohmann::json &doc, const char *key, std::string *out,
                 Error *err) {
  auto it = doc.find(key);
  if (it == doc.end())
    return true;
  if (!it->is_string())
    return fail(err, ErrorKind::InvalidOperation,
                std::string("config key '") + key + "' must be a string");
  *out = it->get<std::string>();
  return true;
}
} // namespace

bool load_config(const std::string &path, VaultConfig *cfg, Error *err) {
  Bytes raw;
  if (!read_file(path, &raw, err))
    return false;
  auto doc = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    return fail(err, ErrorKind::SerializationError,
                "config is not a JSON object: " + path);

  VaultConfig next = *cfg;
  if (!take_string(doc, "cache_dir", &next.cache.root, err) ||
      !take_string(doc, "models_dir", &next.registry.root, err) ||
      !take_string(doc, "log_level", &next.log_level, err))
    return false;

  if (auto it = doc.find("ttl_hours"); it != doc.end()) {
    if (!it->is_number())
      return fail(err, ErrorKind::InvalidOperation,
                  "config key 'ttl_hours' must be a number");
    if (!ttl_from_hours(it->get<double>(), &next.cache.ttl, err))
      return false;
  }
  if (auto it = doc.find("ttl_ms"); it != doc.end()) {
    if (!it->is_number_unsigned())
      return fail(err, ErrorKind::InvalidOperation,
                  "config key 'ttl_ms' must be a non-negative integer");
    next.cache.ttl = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::min<std::uint64_t>(
            it->get<std::uint64_t>(),
            static_cast<std::uint64_t>(kMaxTtlHours * 3600.0 * 1000.0))));
  }

  *cfg = std::move(next);
  return true;
}

bool ttl_from_hours(double hours, std::chrono::milliseconds *out, Error *err) {
  if (!std::isfinite(hours))
    return fail(err, ErrorKind::InvalidOperation, "ttl hours must be finite");
  hours = std::clamp(hours, 0.0, kMaxTtlHours);
  *out = std::chrono::milliseconds(
      static_cast<std::int64_t>(hours * 3600.0 * 1000.0));
  return true;
}

bool parse_ttl_hours(const std::string &text, std::chrono::milliseconds *out,
                     Error *err) {
  double hours = 0.0;
  try {
    std::size_t idx = 0;
    hours = std::stod(text, &idx);
    if (idx != text.size())
      return fail(err, ErrorKind::InvalidOperation,
                  "invalid --ttl-hours value: " + text);
  } catch (const std::exception &) {
    return fail(err, ErrorKind::InvalidOperation,
                "invalid --ttl-hours value: " + text);
  }
  if (hours < 0.0)
    return fail(err, ErrorKind::InvalidOperation,
                "--ttl-hours must not be negative");
  return ttl_from_hours(hours, out, err);
}

double ttl_hours(const CacheConfig &cfg) {
  return std::chrono::duration<double, std::ratio<3600>>(cfg.ttl).count();
}

} // namespace model_vault
