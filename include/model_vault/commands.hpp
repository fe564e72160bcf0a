#pragma once

#include "model_vault/artifact_cache.hpp"
#include "model_vault/version_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace model_vault {

// Structured request/response layer behind model_vault_cli. Every response
// carries a boolean "success"; failures add "error" and "error_kind".

// command: "stats", "clear-expired" or "clear-all".
nlohmann::json run_cache_command(ArtifactCache &cache,
                                 const std::string &command);

// request["action"]: create_version, list_versions, get_version, rollback,
// compare_versions, delete_version or list_models.
nlohmann::json run_version_request(VersionRegistry &registry,
                                   const nlohmann::json &request);

nlohmann::json error_response(const Error &err);

} // namespace model_vault
