#include "model_vault/commands.hpp"
#include "model_vault/config.hpp"
#include "model_vault/logging.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
void usage() {
  std::cerr << "usage:\n"
               "  model_vault_cli cache [stats|clear-expired|clear-all]"
               " [--cache-dir D] [--ttl-hours H] [--config F]\n"
               "  model_vault_cli version '<json request>'"
               " [--models-dir D] [--config F]\n"
               "  common: [--log-level trace|debug|info|warn|error|off]\n";
}

int emit(const nlohmann::json &response) {
  std::cout << response.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace)
            << std::endl;
  return response.value("success", false) ? 0 : 1;
}
} // namespace

int main(int argc, char **argv) {
  try {
    model_vault::VaultConfig cfg;
    std::vector<std::string> positional;
    std::string config_path;
    std::optional<std::string> cache_dir, models_dir, log_level;
    std::optional<std::chrono::milliseconds> ttl;

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc)
        config_path = argv[++i];
      else if (a == "--cache-dir" && i + 1 < argc)
        cache_dir = argv[++i];
      else if (a == "--models-dir" && i + 1 < argc)
        models_dir = argv[++i];
      else if (a == "--log-level" && i + 1 < argc)
        log_level = argv[++i];
      else if (a == "--ttl-hours" && i + 1 < argc) {
        std::chrono::milliseconds parsed{0};
        model_vault::Error err;
        if (!model_vault::parse_ttl_hours(argv[++i], &parsed, &err))
          return emit(model_vault::error_response(err));
        ttl = parsed;
      } else if (a == "--help" || a == "-h") {
        usage();
        return 0;
      } else {
        positional.push_back(std::move(a));
      }
    }

    if (!config_path.empty()) {
      model_vault::Error err;
      if (!model_vault::load_config(config_path, &cfg, &err))
        return emit(model_vault::error_response(err));
    }
    if (cache_dir)
      cfg.cache.root = *cache_dir;
    if (models_dir)
      cfg.registry.root = *models_dir;
    if (log_level)
      cfg.log_level = *log_level;
    if (ttl)
      cfg.cache.ttl = *ttl;
    model_vault::init_logging(cfg.log_level);

    if (positional.empty()) {
      usage();
      return 1;
    }

    if (positional[0] == "cache") {
      model_vault::ArtifactCache cache(cfg.cache);
      const std::string command = positional.size() > 1 ? positional[1] : "stats";
      return emit(model_vault::run_cache_command(cache, command));
    }

    if (positional[0] == "version") {
      if (positional.size() < 2) {
        model_vault::Error err{model_vault::ErrorKind::InvalidOperation,
                               "No input data provided"};
        return emit(model_vault::error_response(err));
      }
      auto request = nlohmann::json::parse(positional[1], nullptr, false);
      if (request.is_discarded()) {
        model_vault::Error err{model_vault::ErrorKind::InvalidOperation,
                               "request is not valid JSON"};
        return emit(model_vault::error_response(err));
      }
      model_vault::VersionRegistry registry(cfg.registry);
      return emit(model_vault::run_version_request(registry, request));
    }

    usage();
    return 1;
  } catch (const std::exception &e) {
    std::cout << nlohmann::json{{"success", false},
                                {"error", e.what()},
                                {"error_kind", "Internal"}}
                     .dump(-1, ' ', false,
                           nlohmann::json::error_handler_t::replace)
              << std::endl;
    return 1;
  }
}
