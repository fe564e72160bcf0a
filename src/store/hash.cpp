#include "model_vault/hash.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace model_vault {
namespace {
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char *digest, unsigned int len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

MdCtx new_sha256() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    ctx.reset();
  return ctx;
}

std::string finish(EVP_MD_CTX *ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1)
    return {};
  return to_hex(digest.data(), len);
}

std::string digest_buffer(const void *data, std::size_t size) {
  auto ctx = new_sha256();
  if (!ctx || EVP_DigestUpdate(ctx.get(), data, size) != 1)
    return {};
  return finish(ctx.get());
}
} // namespace

std::string sha256_hex(const std::string &data) {
  return digest_buffer(data.data(), data.size());
}

std::string sha256_hex(const Bytes &data) {
  return digest_buffer(data.data(), data.size());
}

bool sha256_file_hex(const std::string &path, std::string *out, Error *err) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (errno == ENOENT)
      return fail(err, ErrorKind::NotFound, "blob not found: " + path);
    return fail(err, ErrorKind::IOFailure,
                "cannot open " + path + ": " + std::strerror(errno));
  }
  auto ctx = new_sha256();
  if (!ctx)
    return fail(err, ErrorKind::IOFailure, "sha256 context init failed");
  std::array<char, 64 * 1024> buf{};
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = in.gcount();
    if (n > 0 &&
        EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) !=
            1)
      return fail(err, ErrorKind::IOFailure, "sha256 update failed");
  }
  if (in.bad())
    return fail(err, ErrorKind::IOFailure, "read failed: " + path);
  auto hex = finish(ctx.get());
  if (hex.empty())
    return fail(err, ErrorKind::IOFailure, "sha256 finalize failed");
  *out = std::move(hex);
  return true;
}

bool verify_file(const std::string &path, const std::string &expected,
                 Error *err) {
  std::string actual;
  if (!sha256_file_hex(path, &actual, err))
    return false;
  if (actual != expected)
    return fail(err, ErrorKind::IntegrityViolation,
                "integrity check failed for " + path +
                    ": blob may be corrupted");
  return true;
}

} // namespace model_vault
