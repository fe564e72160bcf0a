#include "model_vault/commands.hpp"

#include <optional>

namespace model_vault {
namespace {
bool require_string(const nlohmann::json &request, const char *key,
                    std::string *out, Error *err) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string())
    return fail(err, ErrorKind::InvalidOperation,
                std::string("missing required field '") + key + "'");
  *out = it->get<std::string>();
  return true;
}

std::optional<std::string> optional_string(const nlohmann::json &request,
                                           const char *key) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

nlohmann::json create_version(VersionRegistry &registry,
                              const nlohmann::json &request) {
  Error err;
  std::string model_id, model_path;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !require_string(request, "model_path", &model_path, &err))
    return error_response(err);
  VersionRecord record;
  if (!registry.create_version(model_id, model_path,
                               optional_string(request, "version_tag"),
                               request.value("metadata", nlohmann::json()),
                               &record, &err))
    return error_response(err);
  ModelRegistryEntry entry;
  if (!registry.list_versions(model_id, &entry, &err))
    return error_response(err);
  return {{"success", true},
          {"model_id", model_id},
          {"version_info", VersionRegistry::record_to_json(record)},
          {"total_versions", entry.versions.size()}};
}

nlohmann::json list_versions(VersionRegistry &registry,
                             const nlohmann::json &request) {
  Error err;
  std::string model_id;
  ModelRegistryEntry entry;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !registry.list_versions(model_id, &entry, &err))
    return error_response(err);
  auto versions = nlohmann::json::array();
  for (const auto &r : entry.versions)
    versions.push_back(VersionRegistry::record_to_json(r));
  nlohmann::json out{{"success", true},
                     {"model_id", model_id},
                     {"current_version", nullptr},
                     {"versions", std::move(versions)},
                     {"total_versions", entry.versions.size()}};
  if (entry.current_version)
    out["current_version"] = *entry.current_version;
  return out;
}

nlohmann::json get_version(VersionRegistry &registry,
                           const nlohmann::json &request) {
  Error err;
  std::string model_id, version_id;
  VersionRecord record;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !require_string(request, "version_id", &version_id, &err) ||
      !registry.get_version(model_id, version_id, &record, &err))
    return error_response(err);
  return {{"success", true},
          {"model_id", model_id},
          {"version_info", VersionRegistry::record_to_json(record)}};
}

nlohmann::json rollback(VersionRegistry &registry,
                        const nlohmann::json &request) {
  Error err;
  std::string model_id, version_id;
  RollbackResult result;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !require_string(request, "version_id", &version_id, &err) ||
      !registry.rollback(model_id, version_id, &result, &err))
    return error_response(err);
  nlohmann::json out{{"success", true},
                     {"model_id", result.model_id},
                     {"rolled_back_to", result.rolled_back_to},
                     {"previous_version", nullptr},
                     {"model_path", result.serving_path},
                     {"timestamp_ms", result.timestamp_ms}};
  if (result.previous_version)
    out["previous_version"] = *result.previous_version;
  return out;
}

nlohmann::json compare_versions(VersionRegistry &registry,
                                const nlohmann::json &request) {
  Error err;
  std::string model_id, v1, v2;
  VersionComparison cmp;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !require_string(request, "version_id_1", &v1, &err) ||
      !require_string(request, "version_id_2", &v2, &err) ||
      !registry.compare_versions(model_id, v1, v2, &cmp, &err))
    return error_response(err);
  auto out = VersionRegistry::comparison_to_json(cmp);
  out["success"] = true;
  return out;
}

nlohmann::json delete_version(VersionRegistry &registry,
                              const nlohmann::json &request) {
  Error err;
  std::string model_id, version_id;
  DeleteResult result;
  if (!require_string(request, "model_id", &model_id, &err) ||
      !require_string(request, "version_id", &version_id, &err) ||
      !registry.delete_version(model_id, version_id, &result, &err))
    return error_response(err);
  return {{"success", true},
          {"model_id", model_id},
          {"deleted_version", result.deleted_version},
          {"remaining_versions", result.remaining_versions}};
}

nlohmann::json list_models(VersionRegistry &registry) {
  Error err;
  std::vector<std::string> models;
  if (!registry.list_models(&models, &err))
    return error_response(err);
  return {{"success", true}, {"models", models}};
}
} // namespace

nlohmann::json error_response(const Error &err) {
  return {{"success", false},
          {"error", err.message},
          {"error_kind", error_kind_name(err.kind)}};
}

nlohmann::json run_cache_command(ArtifactCache &cache,
                                 const std::string &command) {
  Error err;
  if (command == "stats") {
    auto stats = cache.stats_json(&err);
    if (err.kind != ErrorKind::None)
      return error_response(err);
    stats["success"] = true;
    return stats;
  }
  if (command == "clear-expired" || command == "clear-all") {
    const auto n = command == "clear-all" ? cache.clear_all(&err)
                                          : cache.evict_expired(&err);
    if (err.kind != ErrorKind::None)
      return error_response(err);
    return {{"success", true}, {"cleared", n}};
  }
  fail(&err, ErrorKind::InvalidOperation, "Unknown command: " + command);
  return error_response(err);
}

nlohmann::json run_version_request(VersionRegistry &registry,
                                   const nlohmann::json &request) {
  Error err;
  if (!request.is_object()) {
    fail(&err, ErrorKind::InvalidOperation, "request must be a JSON object");
    return error_response(err);
  }
  const auto action = request.value("action", std::string());
  if (action == "create_version")
    return create_version(registry, request);
  if (action == "list_versions")
    return list_versions(registry, request);
  if (action == "get_version")
    return get_version(registry, request);
  if (action == "rollback")
    return rollback(registry, request);
  if (action == "compare_versions")
    return compare_versions(registry, request);
  if (action == "delete_version")
    return delete_version(registry, request);
  if (action == "list_models")
    return list_models(registry);
  fail(&err, ErrorKind::InvalidOperation, "Unknown action: " + action);
  return error_response(err);
}

} // namespace model_vault
