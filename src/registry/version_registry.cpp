#include "model_vault/version_registry.hpp"

#include "model_vault/blob_io.hpp"
#include "model_vault/hash.hpp"
#include "model_vault/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace model_vault {
namespace {
constexpr std::size_t kMaxModelIdLen = 128;

nlohmann::json empty_registry() {
  return nlohmann::json{{"models", nlohmann::json::object()}};
}

// Numbers, booleans (1/0) and fully numeric strings.
bool as_number(const nlohmann::json &v, double *out) {
  if (v.is_number()) {
    *out = v.get<double>();
    return true;
  }
  if (v.is_boolean()) {
    *out = v.get<bool>() ? 1.0 : 0.0;
    return true;
  }
  if (v.is_string()) {
    const auto &s = v.get_ref<const std::string &>();
    if (s.empty())
      return false;
    char *end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size())
      return false;
    *out = d;
    return true;
  }
  return false;
}

std::vector<std::pair<std::string, MetricDelta>>
numeric_deltas(const nlohmann::json &a, const nlohmann::json &b) {
  std::vector<std::pair<std::string, MetricDelta>> out;
  if (!a.is_object() || !b.is_object())
    return out;
  for (const auto &[key, va] : a.items()) {
    auto it = b.find(key);
    if (it == b.end())
      continue;
    MetricDelta d;
    if (!as_number(va, &d.version_1) || !as_number(*it, &d.version_2))
      continue;
    d.difference = d.version_2 - d.version_1;
    d.percent_change =
        d.version_1 != 0.0 ? d.difference / d.version_1 * 100.0 : 0.0;
    out.emplace_back(key, d);
  }
  return out;
}

nlohmann::json deltas_to_json(
    const std::vector<std::pair<std::string, MetricDelta>> &deltas) {
  auto out = nlohmann::json::object();
  for (const auto &[key, d] : deltas)
    out[key] = {{"version_1", d.version_1},
                {"version_2", d.version_2},
                {"difference", d.difference},
                {"percent_change", d.percent_change}};
  return out;
}

bool wants_activation(const nlohmann::json &metadata) {
  if (!metadata.is_object())
    return false;
  auto it = metadata.find(kSetAsCurrentKey);
  return it != metadata.end() && it->is_boolean() && it->get<bool>();
}
} // namespace

std::string format_version_id(std::uint64_t number) {
  return "v" + std::to_string(number);
}

std::optional<std::uint64_t> parse_version_id(const std::string &id) {
  std::size_t pos = 0;
  if (!id.empty() && (id[0] == 'v' || id[0] == 'V'))
    pos = 1;
  if (pos >= id.size() || id.size() - pos > 18)
    return std::nullopt;
  std::uint64_t n = 0;
  for (std::size_t i = pos; i < id.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i])))
      return std::nullopt;
    n = n * 10 + static_cast<std::uint64_t>(id[i] - '0');
  }
  if (n == 0)
    return std::nullopt;
  return n;
}

bool is_valid_model_id(const std::string &model_id) {
  if (model_id.empty() || model_id.size() > kMaxModelIdLen)
    return false;
  if (model_id == "." || model_id == "..")
    return false;
  return std::all_of(model_id.begin(), model_id.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
  });
}

VersionRegistry::VersionRegistry(RegistryConfig cfg)
    : cfg_(std::move(cfg)),
      store_(cfg_.root + "/versions_metadata.json", empty_registry()) {}

std::string VersionRegistry::version_dir(const std::string &model_id,
                                         const std::string &version_id) const {
  return cfg_.root + "/" + model_id + "/" + version_id;
}

std::string VersionRegistry::blob_path(const std::string &model_id,
                                       const std::string &version_id) const {
  return version_dir(model_id, version_id) + "/" + model_id + ".blob";
}

std::string VersionRegistry::serving_path(const std::string &model_id) const {
  return cfg_.root + "/" + model_id + ".blob";
}

nlohmann::json VersionRegistry::record_to_json(const VersionRecord &r) {
  nlohmann::json j{{"model_id", r.model_id},
                   {"version_id", r.version_id},
                   {"version_number", r.version_number},
                   {"version_tag", nullptr},
                   {"blob_path", r.blob_path},
                   {"content_hash", r.content_hash},
                   {"size_bytes", r.size_bytes},
                   {"created_at_ms", r.created_at_ms},
                   {"metadata", r.metadata},
                   {"is_active", r.is_active}};
  if (r.tag)
    j["version_tag"] = *r.tag;
  if (r.activated_at_ms)
    j["activated_at_ms"] = *r.activated_at_ms;
  return j;
}

bool VersionRegistry::parse_record(const nlohmann::json &json,
                                   VersionRecord &out, Error *err) {
  if (!json.is_object())
    return fail(err, ErrorKind::SerializationError,
                "version record is not an object");
  try {
    out.model_id = json.value("model_id", std::string());
    out.version_id = json.at("version_id").get<std::string>();
    out.version_number = json.value(
        "version_number", parse_version_id(out.version_id).value_or(0));
    out.tag.reset();
    if (auto it = json.find("version_tag"); it != json.end() && it->is_string())
      out.tag = it->get<std::string>();
    out.blob_path = json.at("blob_path").get<std::string>();
    out.content_hash = json.at("content_hash").get<std::string>();
    out.size_bytes = json.value("size_bytes", std::size_t{0});
    out.created_at_ms = json.value("created_at_ms", std::uint64_t{0});
    out.metadata = json.value("metadata", nlohmann::json::object());
    out.is_active = json.value("is_active", false);
    out.activated_at_ms.reset();
    if (auto it = json.find("activated_at_ms");
        it != json.end() && it->is_number_unsigned())
      out.activated_at_ms = it->get<std::uint64_t>();
  } catch (const nlohmann::json::exception &e) {
    return fail(err, ErrorKind::SerializationError,
                std::string("malformed version record: ") + e.what());
  }
  return true;
}

nlohmann::json VersionRegistry::entry_to_json(const ModelRegistryEntry &e) {
  auto versions = nlohmann::json::array();
  for (const auto &r : e.versions)
    versions.push_back(record_to_json(r));
  nlohmann::json j{{"versions", std::move(versions)},
                   {"current_version", nullptr},
                   {"next_version_number", e.next_version_number},
                   {"created_at_ms", e.created_at_ms}};
  if (e.current_version)
    j["current_version"] = *e.current_version;
  return j;
}

bool VersionRegistry::parse_entry(const std::string &model_id,
                                  const nlohmann::json &json,
                                  ModelRegistryEntry &out, Error *err) {
  if (!json.is_object() || !json.contains("versions") ||
      !json["versions"].is_array())
    return fail(err, ErrorKind::SerializationError,
                "malformed registry entry for model " + model_id);
  out.model_id = model_id;
  out.versions.clear();
  std::uint64_t highest = 0;
  for (const auto &v : json["versions"]) {
    VersionRecord r;
    if (!parse_record(v, r, err))
      return false;
    if (r.model_id.empty())
      r.model_id = model_id;
    highest = std::max(highest, r.version_number);
    out.versions.push_back(std::move(r));
  }
  out.current_version.reset();
  if (auto it = json.find("current_version");
      it != json.end() && it->is_string())
    out.current_version = it->get<std::string>();
  out.next_version_number =
      std::max(json.value("next_version_number", std::uint64_t{1}),
               highest + 1);
  out.created_at_ms = json.value("created_at_ms", std::uint64_t{0});
  return true;
}

nlohmann::json VersionRegistry::comparison_to_json(const VersionComparison &c) {
  auto side = [](const VersionRecord &r) {
    return nlohmann::json{{"version_id", r.version_id},
                          {"created_at_ms", r.created_at_ms},
                          {"metadata", r.metadata},
                          {"is_active", r.is_active}};
  };
  nlohmann::json differences{{"metadata", deltas_to_json(c.metadata_deltas)}};
  if (c.has_metrics)
    differences["metrics"] = deltas_to_json(c.metric_deltas);
  return nlohmann::json{{"model_id", c.version_1.model_id},
                        {"version_1", side(c.version_1)},
                        {"version_2", side(c.version_2)},
                        {"differences", std::move(differences)}};
}

bool VersionRegistry::find_entry(const nlohmann::json &doc,
                                 const std::string &model_id,
                                 ModelRegistryEntry *out, Error *err) const {
  auto models = doc.find("models");
  if (models == doc.end() || !models->is_object())
    return fail(err, ErrorKind::NotFound, "Model " + model_id + " not found");
  auto it = models->find(model_id);
  if (it == models->end())
    return fail(err, ErrorKind::NotFound, "Model " + model_id + " not found");
  return parse_entry(model_id, *it, *out, err);
}

bool VersionRegistry::find_record(const std::string &model_id,
                                  const std::string &version_id,
                                  VersionRecord *out, Error *err) const {
  nlohmann::json doc;
  if (!store_.read(&doc, err))
    return false;
  ModelRegistryEntry entry;
  if (!find_entry(doc, model_id, &entry, err))
    return false;
  const auto number = parse_version_id(version_id);
  for (const auto &r : entry.versions) {
    if (number && r.version_number == *number) {
      *out = r;
      return true;
    }
  }
  return fail(err, ErrorKind::NotFound,
              "Version " + version_id + " not found for model " + model_id);
}

bool VersionRegistry::create_version(const std::string &model_id,
                                     const std::string &blob_source,
                                     const std::optional<std::string> &tag,
                                     const nlohmann::json &metadata,
                                     VersionRecord *out, Error *err) {
  Bytes blob;
  Error read_err;
  if (!read_file(blob_source, &blob, &read_err)) {
    if (read_err.kind == ErrorKind::NotFound)
      return fail(err, ErrorKind::NotFound,
                  "Model file not found: " + blob_source);
    if (err)
      *err = read_err;
    return false;
  }
  return commit_version(model_id, blob, tag, metadata, out, err);
}

bool VersionRegistry::create_version_from_artifact(
    const std::string &model_id, const Artifact &artifact,
    const std::optional<std::string> &tag, const nlohmann::json &metadata,
    VersionRecord *out, Error *err) {
  return commit_version(model_id, serialize(artifact), tag, metadata, out,
                        err);
}

bool VersionRegistry::commit_version(const std::string &model_id,
                                     const Bytes &blob,
                                     const std::optional<std::string> &tag,
                                     const nlohmann::json &metadata,
                                     VersionRecord *out, Error *err) {
  if (!is_valid_model_id(model_id))
    return fail(err, ErrorKind::InvalidOperation,
                "invalid model id '" + model_id + "'");
  if (!metadata.is_object() && !metadata.is_null())
    return fail(err, ErrorKind::InvalidOperation,
                "version metadata must be a JSON object");

  VersionRecord record;
  bool activated = false;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        if (!doc.contains("models") || !doc["models"].is_object())
          doc["models"] = nlohmann::json::object();
        if (!doc.contains("created_at_ms"))
          doc["created_at_ms"] = now_ms();

        ModelRegistryEntry entry;
        auto &models = doc["models"];
        if (models.contains(model_id)) {
          if (!parse_entry(model_id, models[model_id], entry, e))
            return false;
        } else {
          entry.model_id = model_id;
          entry.created_at_ms = now_ms();
        }

        record = VersionRecord{};
        record.model_id = model_id;
        record.version_number = entry.next_version_number;
        record.version_id = format_version_id(record.version_number);
        record.tag = tag;
        record.blob_path = blob_path(model_id, record.version_id);
        record.metadata =
            metadata.is_null() ? nlohmann::json::object() : metadata;
        record.created_at_ms = now_ms();
        record.size_bytes = blob.size();

        // Leftovers from a writer that died before committing metadata.
        if (!remove_tree(version_dir(model_id, record.version_id), e) ||
            !write_file_atomic(record.blob_path, blob, e) ||
            !sha256_file_hex(record.blob_path, &record.content_hash, e))
          return false;

        activated = entry.versions.empty() || wants_activation(metadata);
        if (activated) {
          if (!copy_file_atomic(record.blob_path, serving_path(model_id), e))
            return false;
          for (auto &v : entry.versions)
            v.is_active = false;
          record.is_active = true;
          record.activated_at_ms = record.created_at_ms;
          entry.current_version = record.version_id;
        }
        entry.versions.push_back(record);
        entry.next_version_number = record.version_number + 1;
        models[model_id] = entry_to_json(entry);
        return true;
      },
      err);
  if (!ok) {
    if (err)
      MV_LOG_ERROR("create version failed",
                   {StringField("model_id", model_id),
                    StringField("error", err->message)});
    return false;
  }
  MV_LOG_INFO("model version created",
              {StringField("model_id", model_id),
               StringField("version_id", record.version_id),
               BoolField("active", activated),
               StringField("hash", record.content_hash.substr(0, 12))});
  if (out)
    *out = std::move(record);
  return true;
}

bool VersionRegistry::list_versions(const std::string &model_id,
                                    ModelRegistryEntry *out,
                                    Error *err) const {
  nlohmann::json doc;
  if (!store_.read(&doc, err))
    return false;
  return find_entry(doc, model_id, out, err);
}

bool VersionRegistry::list_models(std::vector<std::string> *out,
                                  Error *err) const {
  nlohmann::json doc;
  if (!store_.read(&doc, err))
    return false;
  out->clear();
  auto models = doc.find("models");
  if (models == doc.end() || !models->is_object())
    return true;
  for (const auto &[id, _] : models->items())
    out->push_back(id);
  return true;
}

bool VersionRegistry::get_version(const std::string &model_id,
                                  const std::string &version_id,
                                  VersionRecord *out, Error *err) const {
  VersionRecord record;
  if (!find_record(model_id, version_id, &record, err))
    return false;
  Error verify_err;
  if (!verify_file(record.blob_path, record.content_hash, &verify_err)) {
    if (verify_err.kind == ErrorKind::NotFound)
      verify_err.message = "Model file not found: " + record.blob_path;
    MV_LOG_ERROR("version verification failed",
                 {StringField("model_id", model_id),
                  StringField("version_id", record.version_id),
                  StringField("kind", error_kind_name(verify_err.kind))});
    if (err)
      *err = verify_err;
    return false;
  }
  *out = std::move(record);
  return true;
}

bool VersionRegistry::active_version(const std::string &model_id,
                                     VersionRecord *out, Error *err) const {
  ModelRegistryEntry entry;
  if (!list_versions(model_id, &entry, err))
    return false;
  if (!entry.current_version)
    return fail(err, ErrorKind::NotFound,
                "Model " + model_id + " has no active version");
  return get_version(model_id, *entry.current_version, out, err);
}

bool VersionRegistry::load_artifact(const std::string &model_id,
                                    const std::string &version_id,
                                    Artifact *out, Error *err) const {
  VersionRecord record;
  if (!get_version(model_id, version_id, &record, err))
    return false;
  Bytes blob;
  if (!read_file(record.blob_path, &blob, err))
    return false;
  if (sha256_hex(blob) != record.content_hash)
    return fail(err, ErrorKind::IntegrityViolation,
                "blob changed while reading " + record.blob_path);
  return deserialize(blob, *out, err);
}

bool VersionRegistry::rollback(const std::string &model_id,
                               const std::string &version_id,
                               RollbackResult *out, Error *err) {
  RollbackResult result;
  result.model_id = model_id;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        ModelRegistryEntry entry;
        if (!find_entry(doc, model_id, &entry, e))
          return false;
        const auto number = parse_version_id(version_id);
        auto target = std::find_if(
            entry.versions.begin(), entry.versions.end(),
            [&](const VersionRecord &r) {
              return number && r.version_number == *number;
            });
        if (target == entry.versions.end())
          return fail(e, ErrorKind::NotFound,
                      "Version " + version_id + " not found for model " +
                          model_id);
        Error verify_err;
        if (!verify_file(target->blob_path, target->content_hash,
                         &verify_err)) {
          if (verify_err.kind == ErrorKind::NotFound)
            verify_err.message = "Model file not found: " + target->blob_path;
          if (e)
            *e = verify_err;
          return false;
        }
        if (!copy_file_atomic(target->blob_path, serving_path(model_id), e))
          return false;

        result.rolled_back_to = target->version_id;
        result.previous_version = entry.current_version;
        result.serving_path = serving_path(model_id);
        result.timestamp_ms = now_ms();
        if (target->is_active && entry.current_version == target->version_id)
          return true;

        for (auto &v : entry.versions)
          v.is_active = false;
        target->is_active = true;
        target->activated_at_ms = result.timestamp_ms;
        entry.current_version = target->version_id;
        doc["models"][model_id] = entry_to_json(entry);
        return true;
      },
      err);
  if (!ok) {
    if (err)
      MV_LOG_ERROR("rollback failed",
                   {StringField("model_id", model_id),
                    StringField("version_id", version_id),
                    StringField("kind", error_kind_name(err->kind))});
    return false;
  }
  MV_LOG_INFO("model rolled back",
              {StringField("model_id", model_id),
               StringField("to", result.rolled_back_to),
               StringField("from", result.previous_version.value_or("none"))});
  if (out)
    *out = std::move(result);
  return true;
}

bool VersionRegistry::compare_versions(const std::string &model_id,
                                       const std::string &v1,
                                       const std::string &v2,
                                       VersionComparison *out,
                                       Error *err) const {
  VersionComparison cmp;
  if (!get_version(model_id, v1, &cmp.version_1, err) ||
      !get_version(model_id, v2, &cmp.version_2, err))
    return false;
  const auto &m1 = cmp.version_1.metadata;
  const auto &m2 = cmp.version_2.metadata;
  cmp.metadata_deltas = numeric_deltas(m1, m2);
  auto it1 = m1.find("metrics");
  auto it2 = m2.find("metrics");
  if (it1 != m1.end() && it2 != m2.end()) {
    cmp.has_metrics = true;
    cmp.metric_deltas = numeric_deltas(*it1, *it2);
  }
  *out = std::move(cmp);
  return true;
}

bool VersionRegistry::delete_version(const std::string &model_id,
                                     const std::string &version_id,
                                     DeleteResult *out, Error *err) {
  DeleteResult result;
  const bool ok = store_.update(
      [&](nlohmann::json &doc, Error *e) {
        ModelRegistryEntry entry;
        if (!find_entry(doc, model_id, &entry, e))
          return false;
        const auto number = parse_version_id(version_id);
        auto target = std::find_if(
            entry.versions.begin(), entry.versions.end(),
            [&](const VersionRecord &r) {
              return number && r.version_number == *number;
            });
        if (target == entry.versions.end())
          return fail(e, ErrorKind::NotFound,
                      "Version " + version_id + " not found");
        if (target->is_active || entry.current_version == target->version_id)
          return fail(e, ErrorKind::InvalidOperation,
                      "Cannot delete active version. Rollback to another "
                      "version first.");
        result.deleted_version = target->version_id;
        entry.versions.erase(target);
        result.remaining_versions = entry.versions.size();
        doc["models"][model_id] = entry_to_json(entry);
        return true;
      },
      err);
  if (!ok)
    return false;

  Error rm_err;
  if (!remove_tree(version_dir(model_id, result.deleted_version), &rm_err))
    MV_LOG_WARN("version directory left behind",
                {StringField("model_id", model_id),
                 StringField("version_id", result.deleted_version),
                 StringField("error", rm_err.message)});
  MV_LOG_INFO("model version deleted",
              {StringField("model_id", model_id),
               StringField("version_id", result.deleted_version),
               IntField("remaining",
                        static_cast<std::int64_t>(result.remaining_versions))});
  if (out)
    *out = std::move(result);
  return true;
}

} // namespace model_vault
