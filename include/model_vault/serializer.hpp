#pragma once

#include "model_vault/types.hpp"

#include <string>

namespace model_vault {

// An opaque trained-model artifact. The store never looks inside payload;
// type_tag names whatever produced it (e.g. "sklearn.random_forest").
struct Artifact {
  std::string type_tag;
  Bytes payload;

  bool operator==(const Artifact &other) const {
    return type_tag == other.type_tag && payload == other.payload;
  }
};

constexpr std::size_t kMaxTypeTagLen = 256;

Bytes serialize(const Artifact &artifact);
bool deserialize(const Bytes &blob, Artifact &out, Error *err = nullptr);

} // namespace model_vault
