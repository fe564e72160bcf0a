#pragma once

#include "model_vault/config.hpp"
#include "model_vault/metadata_store.hpp"
#include "model_vault/serializer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace model_vault {

struct CacheEntry {
  std::string key;
  std::string kind;
  nlohmann::json configuration = nlohmann::json::object();
  std::string blob_path;
  std::uint64_t created_at_ms{0};
  std::uint64_t last_accessed_at_ms{0};
  std::size_t size_bytes{0};
  nlohmann::json metadata = nlohmann::json::object();
};

struct CacheStats {
  std::size_t total_entries{0};
  std::size_t valid_entries{0};
  std::size_t expired_entries{0};
  std::size_t total_bytes{0};
};

// Compact JSON with object keys sorted. Rejects anything but an object of
// strings, numbers, booleans and nulls.
bool canonical_config_json(const nlohmann::json &configuration,
                           std::string *out, Error *err = nullptr);

// sha256_hex(kind + ":" + canonical_config_json(configuration)).
bool cache_key(const std::string &kind, const nlohmann::json &configuration,
               std::string *out, Error *err = nullptr);

// Content-addressed, TTL-bound store of serialized artifacts. Caching is an
// optimization: get() reports every failure as a miss and purges entries
// whose blob is missing or unreadable. An unparseable metadata.json is
// discarded and rebuilt; clear_all() also removes blobs it no longer names.
class ArtifactCache {
public:
  explicit ArtifactCache(CacheConfig cfg);

  std::optional<Artifact> get(const std::string &kind,
                              const nlohmann::json &configuration);
  bool put(const std::string &kind, const nlohmann::json &configuration,
           const Artifact &artifact,
           const nlohmann::json &metadata = nlohmann::json::object(),
           Error *err = nullptr);

  bool contains(const std::string &kind, const nlohmann::json &configuration);
  bool remove(const std::string &kind, const nlohmann::json &configuration,
              Error *err = nullptr);
  std::optional<CacheEntry> entry(const std::string &kind,
                                  const nlohmann::json &configuration);

  std::size_t evict_expired(Error *err = nullptr);
  std::size_t clear_all(Error *err = nullptr);
  CacheStats stats(Error *err = nullptr) const;
  nlohmann::json stats_json(Error *err = nullptr) const;

  bool key_for(const std::string &kind, const nlohmann::json &configuration,
               std::string *out, Error *err = nullptr) const {
    return cache_key(kind, configuration, out, err);
  }
  const CacheConfig &config() const { return cfg_; }

  static nlohmann::json entry_to_json(const CacheEntry &entry);
  static bool parse_entry(const nlohmann::json &json, CacheEntry &out,
                          Error *err = nullptr);

private:
  std::string blob_path_for(const std::string &key) const;
  bool is_valid(const CacheEntry &entry, std::uint64_t now) const;
  void touch(const std::string &key, std::uint64_t created_at_ms);
  void purge(const std::string &key, std::uint64_t created_at_ms,
             const char *reason);
  std::size_t remove_where(bool expired_only, Error *err);
  void remove_orphan_blobs(const nlohmann::json &doc);

  CacheConfig cfg_;
  MetadataStore store_;
};

} // namespace model_vault
