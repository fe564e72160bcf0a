#include "model_vault/artifact_cache.hpp"

#include "model_vault/blob_io.hpp"
#include "model_vault/hash.hpp"
#include "model_vault/logging.hpp"

#include <cmath>
#include <filesystem>
#include <vector>

namespace model_vault {
namespace {
constexpr std::uint64_t kAnyGeneration = 0;

std::string short_key(const std::string &key) { return key.substr(0, 8); }

bool is_primitive(const nlohmann::json &v) {
  return v.is_string() || v.is_number() || v.is_boolean() || v.is_null();
}
} // namespace

bool canonical_config_json(const nlohmann::json &configuration,
                           std::string *out, Error *err) {
  if (!configuration.is_object())
    return fail(err, ErrorKind::InvalidOperation,
                "configuration must be a JSON object");
  for (const auto &[k, v] : configuration.items()) {
    if (!is_primitive(v))
      return fail(err, ErrorKind::InvalidOperation,
                  "unsupported configuration value for key '" + k +
                      "': only primitives are allowed");
  }
  // nlohmann::json objects are std::map backed, so dump() emits sorted keys.
  *out = configuration.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace);
  return true;
}

bool cache_key(const std::string &kind, const nlohmann::json &configuration,
               std::string *out, Error *err) {
  if (kind.empty())
    return fail(err, ErrorKind::InvalidOperation, "artifact kind is empty");
  std::string canonical;
  if (!canonical_config_json(configuration, &canonical, err))
    return false;
  *out = sha256_hex(kind + ":" + canonical);
  return true;
}

ArtifactCache::ArtifactCache(CacheConfig cfg)
    : cfg_(std::move(cfg)),
      store_(cfg_.root + "/metadata.json", nlohmann::json::object(), true) {}

nlohmann::json ArtifactCache::entry_to_json(const CacheEntry &e) {
  return nlohmann::json{{"key", e.key},
                        {"kind", e.kind},
                        {"configuration", e.configuration},
                        {"blob_path", e.blob_path},
                        {"created_at_ms", e.created_at_ms},
                        {"last_accessed_at_ms", e.last_accessed_at_ms},
                        {"size_bytes", e.size_bytes},
                        {"metadata", e.metadata}};
}

bool ArtifactCache::parse_entry(const nlohmann::json &json, CacheEntry &out,
                                Error *err) {
  if (!json.is_object())
    return fail(err, ErrorKind::SerializationError,
                "cache entry is not an object");
  try {
    out.key = json.at("key").get<std::string>();
    out.kind = json.value("kind", std::string());
    out.configuration = json.value("configuration", nlohmann::json::object());
    out.blob_path = json.at("blob_path").get<std::string>();
    out.created_at_ms = json.at("created_at_ms").get<std::uint64_t>();
    out.last_accessed_at_ms =
        json.value("last_accessed_at_ms", out.created_at_ms);
    out.size_bytes = json.value("size_bytes", std::size_t{0});
    out.metadata = json.value("metadata", nlohmann::json::object());
  } catch (const nlohmann::json::exception &e) {
    return fail(err, ErrorKind::SerializationError,
                std::string("malformed cache entry: ") + e.what());
  }
  return true;
}

std::string ArtifactCache::blob_path_for(const std::string &key) const {
  return cfg_.root + "/" + key + ".blob";
}

bool ArtifactCache::is_valid(const CacheEntry &entry, std::uint64_t now) const {
  const auto ttl = static_cast<std::uint64_t>(cfg_.ttl.count());
  return now < entry.created_at_ms + ttl;
}

std::optional<Artifact> ArtifactCache::get(const std::string &kind,
                                           const nlohmann::json &configuration) {
  std::string key;
  Error err;
  if (!cache_key(kind, configuration, &key, &err)) {
    MV_LOG_WARN("cache miss: bad request", {StringField("error", err.message)});
    return std::nullopt;
  }
  nlohmann::json doc;
  if (!store_.read(&doc, &err)) {
    MV_LOG_WARN("cache miss: metadata unreadable",
                {StringField("error", err.message)});
    return std::nullopt;
  }
  auto it = doc.find(key);
  if (it == doc.end()) {
    MV_LOG_INFO("cache miss", {StringField("key", short_key(key)),
                               StringField("kind", kind)});
    return std::nullopt;
  }
  CacheEntry entry;
  if (!parse_entry(*it, entry, &err)) {
    purge(key, kAnyGeneration, "malformed entry");
    return std::nullopt;
  }
  if (!is_valid(entry, now_ms())) {
    purge(key, entry.created_at_ms, "expired");
    return std::nullopt;
  }

  Bytes blob;
  if (!read_file(blob_path_for(key), &blob, &err)) {
    purge(key, entry.created_at_ms, "blob unreadable");
    return std::nullopt;
  }
  Artifact artifact;
  if (!deserialize(blob, artifact, &err)) {
    purge(key, entry.created_at_ms, "blob corrupt");
    return std::nullopt;
  }

  touch(key, entry.created_at_ms);
  MV_LOG_INFO("cache hit", {StringField("key", short_key(key)),
                            StringField("kind", kind)});
  return artifact;
}

bool ArtifactCache::put(const std::string &kind,
                        const nlohmann::json &configuration,
                        const Artifact &artifact,
                        const nlohmann::json &metadata, Error *err) {
  CacheEntry entry;
  if (!cache_key(kind, configuration, &entry.key, err))
    return false;
  if (!metadata.is_object() && !metadata.is_null())
    return fail(err, ErrorKind::InvalidOperation,
                "cache metadata must be a JSON object");
  const Bytes blob = serialize(artifact);
  entry.kind = kind;
  entry.configuration = configuration;
  entry.blob_path = blob_path_for(entry.key);
  entry.size_bytes = blob.size();
  entry.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

  // The blob is written under the metadata lock so a concurrent purge of
  // the previous generation cannot unlink it.
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        if (!write_file_atomic(entry.blob_path, blob, e))
          return false;
        entry.created_at_ms = now_ms();
        entry.last_accessed_at_ms = entry.created_at_ms;
        doc[entry.key] = entry_to_json(entry);
        return true;
      },
      err);
  if (ok)
    MV_LOG_INFO("model cached", {StringField("key", short_key(entry.key)),
                                 StringField("kind", kind),
                                 IntField("size_bytes",
                                          static_cast<std::int64_t>(
                                              entry.size_bytes))});
  else if (err)
    MV_LOG_ERROR("cache put failed", {StringField("error", err->message)});
  return ok;
}

bool ArtifactCache::contains(const std::string &kind,
                             const nlohmann::json &configuration) {
  auto e = entry(kind, configuration);
  if (!e || !is_valid(*e, now_ms()))
    return false;
  std::error_code ec;
  return std::filesystem::exists(blob_path_for(e->key), ec);
}

std::optional<CacheEntry>
ArtifactCache::entry(const std::string &kind,
                     const nlohmann::json &configuration) {
  std::string key;
  nlohmann::json doc;
  if (!cache_key(kind, configuration, &key) || !store_.read(&doc))
    return std::nullopt;
  auto it = doc.find(key);
  CacheEntry out;
  if (it == doc.end() || !parse_entry(*it, out))
    return std::nullopt;
  return out;
}

bool ArtifactCache::remove(const std::string &kind,
                           const nlohmann::json &configuration, Error *err) {
  std::string key;
  if (!cache_key(kind, configuration, &key, err))
    return false;
  bool found = false;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        auto it = doc.find(key);
        if (it == doc.end())
          return true;
        if (!remove_file(blob_path_for(key), e))
          return false;
        doc.erase(it);
        found = true;
        return true;
      },
      err);
  if (!ok)
    return false;
  if (!found)
    return fail(err, ErrorKind::NotFound,
                "no cache entry for key " + short_key(key));
  MV_LOG_INFO("cache entry removed", {StringField("key", short_key(key))});
  return true;
}

void ArtifactCache::touch(const std::string &key,
                          std::uint64_t created_at_ms) {
  Error err;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *) {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_object() ||
            it->value("created_at_ms", std::uint64_t{0}) != created_at_ms)
          return true;
        (*it)["last_accessed_at_ms"] = now_ms();
        return true;
      },
      &err);
  if (!ok)
    MV_LOG_WARN("cache access time not recorded",
                {StringField("error", err.message)});
}

// created_at_ms identifies the generation that was judged stale; a
// concurrent put that replaced it is left alone. kAnyGeneration matches any.
void ArtifactCache::purge(const std::string &key, std::uint64_t created_at_ms,
                          const char *reason) {
  Error err;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        auto it = doc.find(key);
        if (it == doc.end())
          return true;
        if (created_at_ms != kAnyGeneration && it->is_object() &&
            it->value("created_at_ms", std::uint64_t{0}) != created_at_ms)
          return true;
        if (!remove_file(blob_path_for(key), e))
          return false;
        doc.erase(it);
        return true;
      },
      &err);
  if (ok)
    MV_LOG_INFO("cache entry purged", {StringField("key", short_key(key)),
                                       StringField("reason", reason)});
  else
    MV_LOG_WARN("cache purge failed", {StringField("key", short_key(key)),
                                       StringField("error", err.message)});
}

std::size_t ArtifactCache::remove_where(bool expired_only, Error *err) {
  std::size_t removed = 0;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *) {
        removed = 0;
        const auto now = now_ms();
        std::vector<std::string> victims;
        for (const auto &[key, value] : doc.items()) {
          CacheEntry entry;
          const bool parsed = parse_entry(value, entry);
          if (expired_only && parsed && is_valid(entry, now))
            continue;
          victims.push_back(key);
        }
        for (const auto &key : victims) {
          Error rm_err;
          if (!remove_file(blob_path_for(key), &rm_err)) {
            MV_LOG_WARN("cache blob not removed, keeping entry",
                        {StringField("key", short_key(key)),
                         StringField("error", rm_err.message)});
            continue;
          }
          doc.erase(key);
          ++removed;
          if (expired_only)
            MV_LOG_INFO("removed expired cache entry",
                        {StringField("key", short_key(key))});
        }
        if (!expired_only)
          remove_orphan_blobs(doc);
        return true;
      },
      err);
  if (!ok)
    return 0;
  return removed;
}

// Blobs with no entry, left behind when a corrupt index was discarded.
void ArtifactCache::remove_orphan_blobs(const nlohmann::json &doc) {
  std::error_code ec;
  std::vector<std::string> orphans;
  for (std::filesystem::directory_iterator it(cfg_.root, ec), end;
       !ec && it != end; it.increment(ec)) {
    const auto &p = it->path();
    if (p.extension() == ".blob" && !doc.contains(p.stem().string()))
      orphans.push_back(p.string());
  }
  for (const auto &path : orphans) {
    Error rm_err;
    if (!remove_file(path, &rm_err))
      MV_LOG_WARN("orphan blob not removed",
                  {StringField("path", path), StringField("error", rm_err.message)});
  }
}

std::size_t ArtifactCache::evict_expired(Error *err) {
  return remove_where(true, err);
}

std::size_t ArtifactCache::clear_all(Error *err) {
  const auto n = remove_where(false, err);
  MV_LOG_INFO("cleared cached models", {IntField("count", static_cast<std::int64_t>(n))});
  return n;
}

CacheStats ArtifactCache::stats(Error *err) const {
  CacheStats s;
  nlohmann::json doc;
  if (!store_.read(&doc, err))
    return s;
  const auto now = now_ms();
  for (const auto &[key, value] : doc.items()) {
    CacheEntry entry;
    ++s.total_entries;
    if (!parse_entry(value, entry)) {
      ++s.expired_entries;
      continue;
    }
    s.total_bytes += entry.size_bytes;
    if (is_valid(entry, now))
      ++s.valid_entries;
    else
      ++s.expired_entries;
  }
  return s;
}

nlohmann::json ArtifactCache::stats_json(Error *err) const {
  const auto s = stats(err);
  const double mb = static_cast<double>(s.total_bytes) / (1024.0 * 1024.0);
  return nlohmann::json{{"total_entries", s.total_entries},
                        {"valid_entries", s.valid_entries},
                        {"expired_entries", s.expired_entries},
                        {"total_bytes", s.total_bytes},
                        {"total_size_mb", std::round(mb * 100.0) / 100.0},
                        {"cache_dir", cfg_.root},
                        {"ttl_hours", ttl_hours(cfg_)}};
}

} // namespace model_vault
