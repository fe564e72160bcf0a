#include "model_vault/serializer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace model_vault {
namespace {
#pragma pack(push, 1)
struct BlobHeader {
  std::uint32_t magic;
  std::uint16_t format_version;
  std::uint16_t tag_len;
  std::uint64_t payload_len;
  std::uint32_t checksum;
  std::uint8_t reserved[4];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x3141564d; // MVA1
constexpr std::uint16_t kFormatVersion = 1;

std::uint32_t checksum32(const BlobHeader &h, const std::string &tag,
                         const std::uint8_t *payload, std::size_t len) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(BlobHeader); ++i) {
    if (i >= offsetof(BlobHeader, checksum) &&
        i < offsetof(BlobHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (unsigned char c : tag)
    mix(c);
  for (std::size_t i = 0; i < len; ++i)
    mix(payload[i]);
  return sum;
}
} // namespace

Bytes serialize(const Artifact &artifact) {
  BlobHeader h{};
  h.magic = kMagic;
  h.format_version = kFormatVersion;
  h.tag_len = static_cast<std::uint16_t>(
      std::min(artifact.type_tag.size(), kMaxTypeTagLen));
  h.payload_len = artifact.payload.size();
  const std::string tag = artifact.type_tag.substr(0, h.tag_len);
  h.checksum =
      checksum32(h, tag, artifact.payload.data(), artifact.payload.size());

  Bytes out(sizeof(BlobHeader) + tag.size() + artifact.payload.size());
  std::memcpy(out.data(), &h, sizeof(h));
  std::memcpy(out.data() + sizeof(h), tag.data(), tag.size());
  if (!artifact.payload.empty())
    std::memcpy(out.data() + sizeof(h) + tag.size(), artifact.payload.data(),
                artifact.payload.size());
  return out;
}

bool deserialize(const Bytes &blob, Artifact &out, Error *err) {
  if (blob.size() < sizeof(BlobHeader))
    return fail(err, ErrorKind::SerializationError, "blob truncated: no header");
  BlobHeader h{};
  std::memcpy(&h, blob.data(), sizeof(h));
  if (h.magic != kMagic)
    return fail(err, ErrorKind::SerializationError, "blob magic mismatch");
  if (h.format_version != kFormatVersion)
    return fail(err, ErrorKind::SerializationError,
                "unsupported blob format version " +
                    std::to_string(h.format_version));
  if (h.tag_len > kMaxTypeTagLen)
    return fail(err, ErrorKind::SerializationError, "type tag too long");
  const std::size_t body = blob.size() - sizeof(BlobHeader);
  if (h.tag_len > body || h.payload_len != body - h.tag_len)
    return fail(err, ErrorKind::SerializationError, "blob length mismatch");

  const auto *tag_ptr = blob.data() + sizeof(BlobHeader);
  const auto *payload_ptr = tag_ptr + h.tag_len;
  std::string tag(reinterpret_cast<const char *>(tag_ptr), h.tag_len);
  if (checksum32(h, tag, payload_ptr, static_cast<std::size_t>(h.payload_len)) !=
      h.checksum)
    return fail(err, ErrorKind::SerializationError, "blob checksum mismatch");

  out.type_tag = std::move(tag);
  out.payload.assign(payload_ptr, payload_ptr + h.payload_len);
  return true;
}

} // namespace model_vault
