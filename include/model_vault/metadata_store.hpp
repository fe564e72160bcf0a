#pragma once

#include "model_vault/types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace model_vault {

// Advisory flock(2) on a dedicated lock file. Released on destruction.
class FileLock {
public:
  explicit FileLock(std::string path);
  ~FileLock();
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  bool acquire(bool exclusive, Error *err = nullptr);
  void release();
  bool held() const { return fd_ >= 0; }

private:
  std::string path_;
  int fd_{-1};
};

// One JSON document on disk. Writers serialize through update(), which
// holds an exclusive lock across read, mutate and atomic replace; readers
// take a shared lock only for the read itself.
class MetadataStore {
public:
  using Mutator = std::function<bool(nlohmann::json &doc, Error *err)>;

  // With recover_corrupt, an unparseable document reads as the empty
  // document and the next update() replaces it. Otherwise it is a
  // SerializationError and the file is left as found.
  MetadataStore(std::string path, nlohmann::json empty_document,
                bool recover_corrupt = false);

  // A missing file reads as the empty document.
  bool read(nlohmann::json *out, Error *err = nullptr) const;

  // Aborts without writing when fn returns false. Skips the write when fn
  // left the document unchanged.
  bool update(const Mutator &fn, Error *err = nullptr);

  const std::string &path() const { return path_; }
  std::string lock_path() const { return path_ + ".lock"; }

private:
  bool load_unlocked(nlohmann::json *out, bool *recovered, Error *err) const;
  bool store_unlocked(const nlohmann::json &doc, Error *err) const;

  std::string path_;
  nlohmann::json empty_document_;
  bool recover_corrupt_{false};
};

} // namespace model_vault
