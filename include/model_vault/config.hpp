#pragma once

#include "model_vault/types.hpp"

#include <chrono>
#include <string>

namespace model_vault {

struct CacheConfig {
  std::string root{"./cache/models"};
  std::chrono::milliseconds ttl{std::chrono::hours(24)};
};

struct RegistryConfig {
  std::string root{"./models/versions"};
};

struct VaultConfig {
  CacheConfig cache;
  RegistryConfig registry;
  std::string log_level{"info"};
};

// Overlays keys from a JSON file onto *cfg:
//   {"cache_dir": "...", "ttl_hours": 24, "ttl_ms": 1000,
//    "models_dir": "...", "log_level": "info"}
// Out-of-range numbers are clamped. A malformed file or a key of the wrong
// type leaves *cfg untouched.
bool load_config(const std::string &path, VaultConfig *cfg,
                 Error *err = nullptr);

double ttl_hours(const CacheConfig &cfg);

// Clamps to [0, one year]. NaN and infinities are InvalidOperation.
bool ttl_from_hours(double hours, std::chrono::milliseconds *out,
                    Error *err = nullptr);

// Parses a --ttl-hours argument: a whole decimal number, not negative.
bool parse_ttl_hours(const std::string &text, std::chrono::milliseconds *out,
                     Error *err = nullptr);

} // namespace model_vault
