#pragma once

#include "model_vault/config.hpp"
#include "model_vault/metadata_store.hpp"
#include "model_vault/serializer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace model_vault {

struct VersionRecord {
  std::string model_id;
  std::string version_id;
  std::uint64_t version_number{0};
  std::optional<std::string> tag;
  std::string blob_path;
  std::string content_hash;
  std::size_t size_bytes{0};
  std::uint64_t created_at_ms{0};
  nlohmann::json metadata = nlohmann::json::object();
  bool is_active{false};
  std::optional<std::uint64_t> activated_at_ms;
};

struct ModelRegistryEntry {
  std::string model_id;
  std::vector<VersionRecord> versions;
  std::optional<std::string> current_version;
  std::uint64_t next_version_number{1};
  std::uint64_t created_at_ms{0};
};

struct RollbackResult {
  std::string model_id;
  std::string rolled_back_to;
  std::optional<std::string> previous_version;
  std::string serving_path;
  std::uint64_t timestamp_ms{0};
};

struct DeleteResult {
  std::string deleted_version;
  std::size_t remaining_versions{0};
};

struct MetricDelta {
  double version_1{0.0};
  double version_2{0.0};
  double difference{0.0};
  double percent_change{0.0};
};

struct VersionComparison {
  VersionRecord version_1;
  VersionRecord version_2;
  std::vector<std::pair<std::string, MetricDelta>> metadata_deltas;
  std::vector<std::pair<std::string, MetricDelta>> metric_deltas;
  bool has_metrics{false};
};

// Metadata key that asks create_version to activate the new record.
inline constexpr const char *kSetAsCurrentKey = "set_as_current";

std::string format_version_id(std::uint64_t number);
// Accepts "v3" or "3".
std::optional<std::uint64_t> parse_version_id(const std::string &id);

bool is_valid_model_id(const std::string &model_id);

// Per-model version history. Each model has at most one active record;
// version numbers are never reused. Every mutation is a locked
// read-modify-write of versions_metadata.json, and every read of a record
// re-hashes its blob.
class VersionRegistry {
public:
  explicit VersionRegistry(RegistryConfig cfg);

  bool create_version(const std::string &model_id,
                      const std::string &blob_source,
                      const std::optional<std::string> &tag,
                      const nlohmann::json &metadata, VersionRecord *out,
                      Error *err = nullptr);
  bool create_version_from_artifact(const std::string &model_id,
                                    const Artifact &artifact,
                                    const std::optional<std::string> &tag,
                                    const nlohmann::json &metadata,
                                    VersionRecord *out, Error *err = nullptr);

  bool list_versions(const std::string &model_id, ModelRegistryEntry *out,
                     Error *err = nullptr) const;
  bool list_models(std::vector<std::string> *out, Error *err = nullptr) const;
  bool get_version(const std::string &model_id, const std::string &version_id,
                   VersionRecord *out, Error *err = nullptr) const;
  bool active_version(const std::string &model_id, VersionRecord *out,
                      Error *err = nullptr) const;
  bool load_artifact(const std::string &model_id,
                     const std::string &version_id, Artifact *out,
                     Error *err = nullptr) const;

  bool rollback(const std::string &model_id, const std::string &version_id,
                RollbackResult *out, Error *err = nullptr);
  bool compare_versions(const std::string &model_id, const std::string &v1,
                        const std::string &v2, VersionComparison *out,
                        Error *err = nullptr) const;
  // The record is dropped from the document first; the version directory
  // is removed after that commit.
  bool delete_version(const std::string &model_id,
                      const std::string &version_id,
                      DeleteResult *out = nullptr, Error *err = nullptr);

  std::string serving_path(const std::string &model_id) const;
  const RegistryConfig &config() const { return cfg_; }

  static nlohmann::json record_to_json(const VersionRecord &record);
  static bool parse_record(const nlohmann::json &json, VersionRecord &out,
                           Error *err = nullptr);
  static nlohmann::json entry_to_json(const ModelRegistryEntry &entry);
  static bool parse_entry(const std::string &model_id,
                          const nlohmann::json &json, ModelRegistryEntry &out,
                          Error *err = nullptr);
  static nlohmann::json comparison_to_json(const VersionComparison &cmp);

private:
  std::string version_dir(const std::string &model_id,
                          const std::string &version_id) const;
  std::string blob_path(const std::string &model_id,
                        const std::string &version_id) const;
  bool commit_version(const std::string &model_id, const Bytes &blob,
                      const std::optional<std::string> &tag,
                      const nlohmann::json &metadata, VersionRecord *out,
                      Error *err);
  bool find_entry(const nlohmann::json &doc, const std::string &model_id,
                  ModelRegistryEntry *out, Error *err) const;
  bool find_record(const std::string &model_id, const std::string &version_id,
                   VersionRecord *out, Error *err) const;

  RegistryConfig cfg_;
  MetadataStore store_;
};

} // namespace model_vault
