#include "model_vault/blob_io.hpp"
#include "model_vault/hash.hpp"
#include "model_vault/version_registry.hpp"
#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace model_vault;
using nlohmann::json;

namespace {
struct Fixture {
  std::string dir;
  VersionRegistry registry;

  explicit Fixture(const std::string &name)
      : dir(test_util::scratch_dir(name)),
        registry(RegistryConfig{dir + "/versions"}) {}

  std::string blob(const std::string &name, const std::string &content) {
    const auto path = dir + "/" + name;
    test_util::write_text(path, content);
    return path;
  }

  VersionRecord create(const std::string &model, const std::string &content,
                       const json &metadata = json::object()) {
    VersionRecord r;
    Error err;
    const bool ok = registry.create_version(model, blob("src.pkl", content),
                                            std::nullopt, metadata, &r, &err);
    INFO(err.message);
    REQUIRE(ok);
    return r;
  }

  std::size_t active_count(const std::string &model) {
    ModelRegistryEntry entry;
    REQUIRE(registry.list_versions(model, &entry));
    std::size_t n = 0;
    for (const auto &v : entry.versions)
      n += v.is_active ? 1 : 0;
    return n;
  }
};
} // namespace

TEST_CASE("version ids format and parse", "[registry][ids]") {
  CHECK(format_version_id(3) == "v3");
  CHECK(parse_version_id("v12") == 12u);
  CHECK(parse_version_id("7") == 7u);
  CHECK_FALSE(parse_version_id("v0").has_value());
  CHECK_FALSE(parse_version_id("vx").has_value());
  CHECK_FALSE(parse_version_id("").has_value());
  CHECK(is_valid_model_id("house-price_2.0"));
  CHECK_FALSE(is_valid_model_id("../etc"));
  CHECK_FALSE(is_valid_model_id(".."));
  CHECK_FALSE(is_valid_model_id(""));
}

TEST_CASE("create_version copies blob, hashes it and activates the first",
          "[registry][create]") {
  Fixture f("reg_create");
  const auto src = f.blob("model.pkl", "weights-A");
  VersionRecord r;
  REQUIRE(f.registry.create_version("house-price", src, std::string("baseline"),
                                    json{{"metrics", {{"r2", 0.8}}}}, &r));
  CHECK(r.version_id == "v1");
  CHECK(r.version_number == 1);
  CHECK(r.is_active);
  CHECK(r.tag == std::optional<std::string>("baseline"));
  CHECK(r.content_hash == sha256_hex(std::string("weights-A")));
  CHECK(r.blob_path == f.dir + "/versions/house-price/v1/house-price.blob");
  CHECK(test_util::read_text(r.blob_path) == "weights-A");
  CHECK(test_util::read_text(src) == "weights-A");
  CHECK(test_util::read_text(f.registry.serving_path("house-price")) == "weights-A");

  Error err;
  CHECK_FALSE(f.registry.create_version("house-price", f.dir + "/nope.pkl",
                                        std::nullopt, json(), &r, &err));
  CHECK(err.kind == ErrorKind::NotFound);
  CHECK_FALSE(f.registry.create_version("../escape", src, std::nullopt, json(),
                                        &r, &err));
  CHECK(err.kind == ErrorKind::InvalidOperation);
}

TEST_CASE("set_as_current activates exclusively", "[registry][active]") {
  Fixture f("reg_activate");
  f.create("m", "a");
  auto second = f.create("m", "b");
  CHECK_FALSE(second.is_active);
  CHECK(f.active_count("m") == 1);

  auto third = f.create("m", "c", json{{"set_as_current", true}});
  CHECK(third.is_active);
  CHECK(f.active_count("m") == 1);

  ModelRegistryEntry entry;
  REQUIRE(f.registry.list_versions("m", &entry));
  CHECK(entry.current_version == std::optional<std::string>("v3"));
  CHECK_FALSE(entry.versions[0].is_active);
  VersionRecord active;
  REQUIRE(f.registry.active_version("m", &active));
  CHECK(active.version_id == "v3");
}

TEST_CASE("version numbers are never reused after deletion",
          "[registry][numbering]") {
  Fixture f("reg_numbering");
  f.create("m", "1");
  f.create("m", "2");
  f.create("m", "3");
  DeleteResult deleted;
  REQUIRE(f.registry.delete_version("m", "v3", &deleted));
  CHECK(deleted.remaining_versions == 2);
  REQUIRE(f.registry.delete_version("m", "v2"));
  auto next = f.create("m", "4");
  CHECK(next.version_id == "v4");
  auto after = f.create("m", "5");
  CHECK(after.version_id == "v5");

  ModelRegistryEntry entry;
  REQUIRE(f.registry.list_versions("m", &entry));
  REQUIRE(entry.versions.size() == 3);
  CHECK(entry.versions[0].version_id == "v1");
  CHECK(entry.versions[1].version_id == "v4");
  CHECK(entry.versions[2].version_id == "v5");
  CHECK(entry.next_version_number == 6);
  CHECK_FALSE(std::filesystem::exists(f.dir + "/versions/m/v2"));
}

TEST_CASE("unknown model and version are NotFound", "[registry][errors]") {
  Fixture f("reg_notfound");
  Error err;
  ModelRegistryEntry entry;
  CHECK_FALSE(f.registry.list_versions("ghost", &entry, &err));
  CHECK(err.kind == ErrorKind::NotFound);

  f.create("m", "a");
  VersionRecord r;
  CHECK_FALSE(f.registry.get_version("m", "v9", &r, &err));
  CHECK(err.kind == ErrorKind::NotFound);
  RollbackResult rb;
  CHECK_FALSE(f.registry.rollback("m", "v9", &rb, &err));
  CHECK(err.kind == ErrorKind::NotFound);
  CHECK_FALSE(f.registry.rollback("ghost", "v1", &rb, &err));
  CHECK(err.kind == ErrorKind::NotFound);
  CHECK_FALSE(f.registry.delete_version("m", "v9", nullptr, &err));
  CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE("tampered blob fails get_version and rollback",
          "[registry][integrity]") {
  Fixture f("reg_integrity");
  f.create("m", "good-1");
  auto v2 = f.create("m", "good-2");
  test_util::write_text(v2.blob_path, "evil-2");

  Error err;
  VersionRecord r;
  CHECK_FALSE(f.registry.get_version("m", "v2", &r, &err));
  CHECK(err.kind == ErrorKind::IntegrityViolation);

  RollbackResult rb;
  CHECK_FALSE(f.registry.rollback("m", "v2", &rb, &err));
  CHECK(err.kind == ErrorKind::IntegrityViolation);
  CHECK(f.active_count("m") == 1);
  ModelRegistryEntry entry;
  REQUIRE(f.registry.list_versions("m", &entry));
  CHECK(entry.current_version == std::optional<std::string>("v1"));

  std::filesystem::remove(v2.blob_path);
  CHECK_FALSE(f.registry.get_version("m", "v2", &r, &err));
  CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE("rollback to the active version is a no-op that succeeds",
          "[registry][rollback]") {
  Fixture f("reg_idempotent");
  f.create("m", "a");
  f.create("m", "b");
  const auto doc_path = f.dir + "/versions/versions_metadata.json";
  const auto before = test_util::read_text(doc_path);

  RollbackResult rb;
  REQUIRE(f.registry.rollback("m", "v1", &rb));
  CHECK(rb.rolled_back_to == "v1");
  CHECK(rb.previous_version == std::optional<std::string>("v1"));
  CHECK(test_util::read_text(doc_path) == before);
  CHECK(f.active_count("m") == 1);
}

TEST_CASE("house-price rollback and delete scenario", "[registry][scenario]") {
  Fixture f("reg_scenario");
  auto v1 = f.create("house-price", "blobA");
  CHECK(v1.version_id == "v1");
  CHECK(v1.is_active);
  auto v2 = f.create("house-price", "blobB");
  CHECK(v2.version_id == "v2");
  CHECK_FALSE(v2.is_active);

  RollbackResult rb;
  REQUIRE(f.registry.rollback("house-price", "v2", &rb));
  CHECK(rb.previous_version == std::optional<std::string>("v1"));
  CHECK(test_util::read_text(rb.serving_path) == "blobB");
  VersionRecord r;
  REQUIRE(f.registry.get_version("house-price", "v2", &r));
  CHECK(r.is_active);
  CHECK(r.activated_at_ms.has_value());
  REQUIRE(f.registry.get_version("house-price", "v1", &r));
  CHECK_FALSE(r.is_active);

  const auto doc_path = f.dir + "/versions/versions_metadata.json";
  const auto before = test_util::read_text(doc_path);
  Error err;
  CHECK_FALSE(f.registry.delete_version("house-price", "v2", nullptr, &err));
  CHECK(err.kind == ErrorKind::InvalidOperation);
  CHECK(test_util::read_text(doc_path) == before);
  CHECK(std::filesystem::exists(v2.blob_path));

  REQUIRE(f.registry.rollback("house-price", "1", &rb));
  DeleteResult deleted;
  REQUIRE(f.registry.delete_version("house-price", "2", &deleted));
  CHECK(deleted.deleted_version == "v2");
  CHECK(deleted.remaining_versions == 1);
  CHECK_FALSE(std::filesystem::exists(v2.blob_path));
  CHECK(f.active_count("house-price") == 1);
  CHECK(test_util::read_text(f.registry.serving_path("house-price")) == "blobA");
}

TEST_CASE("failed delete commit keeps the version's blob", "[registry][delete]") {
  Fixture f("reg_delete_commit");
  f.create("m", "a");
  auto v2 = f.create("m", "b");
  const auto doc_path = f.dir + "/versions/versions_metadata.json";
  const auto before = test_util::read_text(doc_path);
  // A directory where the atomic write puts its temp file makes the commit fail.
  const auto blocker = doc_path + ".tmp." + std::to_string(::getpid());
  std::filesystem::create_directories(blocker);

  Error err;
  CHECK_FALSE(f.registry.delete_version("m", "v2", nullptr, &err));
  CHECK(err.kind == ErrorKind::IOFailure);
  CHECK(test_util::read_text(doc_path) == before);
  CHECK(std::filesystem::exists(v2.blob_path));

  std::filesystem::remove(blocker);
  VersionRecord r;
  REQUIRE(f.registry.get_version("m", "v2", &r));
  REQUIRE(f.registry.delete_version("m", "v2"));
  CHECK_FALSE(std::filesystem::exists(f.dir + "/versions/m/v2"));
}

TEST_CASE("compare_versions reports numeric deltas only",
          "[registry][compare]") {
  Fixture f("reg_compare");
  f.create("m", "a",
           json{{"metrics", {{"r2", 0.8}, {"rmse", 10.0}, {"note", "x"}, {"mae", 0},
                             {"calibrated", false}}},
                {"n_features", 12},
                {"trainer", "rf"},
                {"only_v1", 1}});
  f.create("m", "b",
           json{{"metrics", {{"r2", 0.9}, {"rmse", "8"}, {"note", "y"}, {"mae", 2},
                             {"calibrated", true}}},
                {"n_features", 15},
                {"trainer", "gb"}});

  VersionComparison cmp;
  REQUIRE(f.registry.compare_versions("m", "v1", "v2", &cmp));
  REQUIRE(cmp.has_metrics);
  REQUIRE(cmp.metric_deltas.size() == 4);
  // Sorted by key: calibrated, mae, r2, rmse.
  CHECK(cmp.metric_deltas[0].first == "calibrated");
  CHECK(cmp.metric_deltas[0].second.version_1 == 0.0);
  CHECK(cmp.metric_deltas[0].second.version_2 == 1.0);
  CHECK(cmp.metric_deltas[0].second.difference == 1.0);
  CHECK(cmp.metric_deltas[1].first == "mae");
  CHECK(cmp.metric_deltas[1].second.percent_change == 0.0);
  CHECK(cmp.metric_deltas[2].first == "r2");
  CHECK_THAT(cmp.metric_deltas[2].second.difference,
             Catch::Matchers::WithinAbs(0.1, 1e-9));
  CHECK_THAT(cmp.metric_deltas[2].second.percent_change,
             Catch::Matchers::WithinAbs(12.5, 1e-9));
  CHECK(cmp.metric_deltas[3].first == "rmse");
  CHECK_THAT(cmp.metric_deltas[3].second.percent_change,
             Catch::Matchers::WithinAbs(-20.0, 1e-9));

  REQUIRE(cmp.metadata_deltas.size() == 1);
  CHECK(cmp.metadata_deltas[0].first == "n_features");
  CHECK(cmp.metadata_deltas[0].second.difference == 3.0);

  auto j = VersionRegistry::comparison_to_json(cmp);
  CHECK(j["differences"]["metrics"]["r2"].contains("percent_change"));
  CHECK_FALSE(j["differences"]["metrics"].contains("note"));
}

TEST_CASE("artifacts stored as versions load back verified",
          "[registry][artifact]") {
  Fixture f("reg_artifact");
  Artifact a{"xgboost.booster", Bytes{1, 2, 3, 4, 5}};
  VersionRecord r;
  REQUIRE(f.registry.create_version_from_artifact("churn", a, std::nullopt,
                                                  json(), &r));
  Artifact back;
  REQUIRE(f.registry.load_artifact("churn", r.version_id, &back));
  CHECK(back == a);

  f.create("churn", "raw-bytes-not-framed");
  Error err;
  CHECK_FALSE(f.registry.load_artifact("churn", "v2", &back, &err));
  CHECK(err.kind == ErrorKind::SerializationError);

  std::vector<std::string> models;
  REQUIRE(f.registry.list_models(&models));
  CHECK(models == std::vector<std::string>{"churn"});
}

TEST_CASE("exactly one active after random create/rollback sequences",
          "[registry][active]") {
  Fixture f("reg_random");
  std::uint64_t seed = 12345;
  auto next = [&]() {
    seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
    return seed >> 33;
  };
  std::uint64_t created = 0;
  for (int i = 0; i < 30; ++i) {
    if (created == 0 || next() % 3 == 0) {
      f.create("m", "blob-" + std::to_string(i),
               json{{"set_as_current", next() % 2 == 0}});
      ++created;
    } else {
      RollbackResult rb;
      REQUIRE(f.registry.rollback("m", format_version_id(next() % created + 1), &rb));
    }
    REQUIRE(f.active_count("m") == 1);
  }
}

TEST_CASE("concurrent create_version from several processes",
          "[registry][concurrency]") {
  const auto dir = test_util::scratch_dir("reg_race");
  const RegistryConfig cfg{dir + "/versions"};
  constexpr int kProcs = 4;
  constexpr int kEach = 5;
  std::vector<pid_t> children;
  for (int p = 0; p < kProcs; ++p) {
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
      VersionRegistry registry(cfg);
      for (int i = 0; i < kEach; ++i) {
        Artifact a{"rf", Bytes(16, static_cast<std::uint8_t>(p * 16 + i))};
        if (!registry.create_version_from_artifact("shared", a, std::nullopt,
                                                   json(), nullptr))
          _exit(1);
      }
      _exit(0);
    }
    children.push_back(pid);
  }
  for (pid_t pid : children) {
    int status = 0;
    waitpid(pid, &status, 0);
    CHECK(WEXITSTATUS(status) == 0);
  }

  VersionRegistry registry(cfg);
  ModelRegistryEntry entry;
  REQUIRE(registry.list_versions("shared", &entry));
  REQUIRE(entry.versions.size() == kProcs * kEach);
  std::size_t active = 0;
  for (std::size_t i = 0; i < entry.versions.size(); ++i) {
    CHECK(entry.versions[i].version_number == i + 1);
    active += entry.versions[i].is_active ? 1 : 0;
    VersionRecord r;
    CHECK(registry.get_version("shared", entry.versions[i].version_id, &r));
  }
  CHECK(active == 1);
}
