#include "model_vault/blob_io.hpp"
#include "model_vault/hash.hpp"
#include "model_vault/serializer.hpp"
#include "test_util.hpp"

#include <catch2/catch.hpp>

using namespace model_vault;

TEST_CASE("sha256 matches known vectors", "[hash]") {
  CHECK(sha256_hex(std::string()) ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(sha256_hex(std::string("abc")) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  Bytes abc{'a', 'b', 'c'};
  CHECK(sha256_hex(abc) == sha256_hex(std::string("abc")));
}

TEST_CASE("file hash and verification", "[hash]") {
  const auto dir = test_util::scratch_dir("hash");
  const auto path = dir + "/blob.bin";
  test_util::write_text(path, "abc");

  std::string hex;
  REQUIRE(sha256_file_hex(path, &hex));
  CHECK(hex == sha256_hex(std::string("abc")));
  CHECK(verify_file(path, hex));

  test_util::write_text(path, "abd");
  Error err;
  CHECK_FALSE(verify_file(path, hex, &err));
  CHECK(err.kind == ErrorKind::IntegrityViolation);

  CHECK_FALSE(sha256_file_hex(dir + "/missing.bin", &hex, &err));
  CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE("serializer roundtrip preserves tag and payload",
          "[serializer][roundtrip]") {
  Artifact a{"sklearn.random_forest", {0, 1, 2, 254, 255}};
  Artifact b;
  REQUIRE(deserialize(serialize(a), b));
  CHECK(b == a);

  Artifact empty{"", {}};
  Artifact c;
  REQUIRE(deserialize(serialize(empty), c));
  CHECK(c == empty);
}

TEST_CASE("deserialize rejects damaged blobs", "[serializer][adversarial]") {
  Artifact a{"linear_regression", Bytes(64, 7)};
  const auto blob = serialize(a);
  Artifact out;
  Error err;

  CHECK_FALSE(deserialize(Bytes(blob.begin(), blob.begin() + 10), out, &err));
  CHECK(err.kind == ErrorKind::SerializationError);

  auto truncated = blob;
  truncated.pop_back();
  CHECK_FALSE(deserialize(truncated, out, &err));
  CHECK(err.message.find("length") != std::string::npos);

  auto flipped = blob;
  flipped.back() ^= 0xFF;
  CHECK_FALSE(deserialize(flipped, out, &err));
  CHECK(err.message.find("checksum") != std::string::npos);

  auto bad_magic = blob;
  bad_magic[0] = 'X';
  CHECK_FALSE(deserialize(bad_magic, out, &err));
  CHECK(err.message.find("magic") != std::string::npos);

  Bytes pickle{0x80, 0x04, 0x95};
  CHECK_FALSE(deserialize(pickle, out, &err));
  CHECK(err.kind == ErrorKind::SerializationError);
}

TEST_CASE("atomic write replaces content and leaves no temp file",
          "[blob_io]") {
  const auto dir = test_util::scratch_dir("blob_io");
  const auto path = dir + "/nested/a.blob";
  REQUIRE(write_file_atomic(path, std::string("first")));
  REQUIRE(write_file_atomic(path, std::string("second")));
  CHECK(test_util::read_text(path) == "second");

  std::size_t files = 0;
  for (const auto &e : std::filesystem::directory_iterator(dir + "/nested")) {
    (void)e;
    ++files;
  }
  CHECK(files == 1);

  REQUIRE(copy_file_atomic(path, dir + "/copy.blob"));
  CHECK(test_util::read_text(dir + "/copy.blob") == "second");

  REQUIRE(remove_file(path));
  CHECK(remove_file(path));
  Bytes data;
  Error err;
  CHECK_FALSE(read_file(path, &data, &err));
  CHECK(err.kind == ErrorKind::NotFound);
}
