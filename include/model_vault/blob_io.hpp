#pragma once

#include "model_vault/types.hpp"

#include <string>

namespace model_vault {

bool read_file(const std::string &path, Bytes *out, Error *err = nullptr);

// Writes to a sibling temp file, fsyncs it, renames it over path and fsyncs
// the directory. Readers see either the old file or the new one.
bool write_file_atomic(const std::string &path, const Bytes &data,
                       Error *err = nullptr);
bool write_file_atomic(const std::string &path, const std::string &data,
                       Error *err = nullptr);

bool copy_file_atomic(const std::string &src, const std::string &dst,
                      Error *err = nullptr);

// Missing files count as removed.
bool remove_file(const std::string &path, Error *err = nullptr);
bool remove_tree(const std::string &path, Error *err = nullptr);

bool ensure_dir(const std::string &path, Error *err = nullptr);

} // namespace model_vault
