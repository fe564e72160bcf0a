#pragma once

#include "model_vault/types.hpp"

#include <string>

namespace model_vault {

std::string sha256_hex(const std::string &data);
std::string sha256_hex(const Bytes &data);

// Streams the file through the digest; NotFound if it does not exist,
// IOFailure on read errors.
bool sha256_file_hex(const std::string &path, std::string *out,
                     Error *err = nullptr);

// IntegrityViolation when the recomputed digest differs from expected.
bool verify_file(const std::string &path, const std::string &expected,
                 Error *err = nullptr);

} // namespace model_vault
