#include "model_vault/metadata_store.hpp"

#include "model_vault/blob_io.hpp"
#include "model_vault/logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace model_vault {

FileLock::FileLock(std::string path) : path_(std::move(path)) {}

FileLock::~FileLock() { release(); }

bool FileLock::acquire(bool exclusive, Error *err) {
  if (fd_ >= 0)
    return true;
  fd_ = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd_ < 0)
    return fail(err, ErrorKind::IOFailure,
                "cannot open lock " + path_ + ": " + std::strerror(errno));
  int rc = 0;
  do {
    rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    const std::string msg = std::strerror(errno);
    close(fd_);
    fd_ = -1;
    return fail(err, ErrorKind::IOFailure, "flock " + path_ + ": " + msg);
  }
  return true;
}

void FileLock::release() {
  if (fd_ < 0)
    return;
  ::flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

MetadataStore::MetadataStore(std::string path, nlohmann::json empty_document,
                             bool recover_corrupt)
    : path_(std::move(path)), empty_document_(std::move(empty_document)),
      recover_corrupt_(recover_corrupt) {}

bool MetadataStore::read(nlohmann::json *out, Error *err) const {
  auto dir = std::filesystem::path(path_).parent_path().string();
  if (!dir.empty() && !ensure_dir(dir, err))
    return false;
  FileLock lock(lock_path());
  if (!lock.acquire(false, err))
    return false;
  bool recovered = false;
  return load_unlocked(out, &recovered, err);
}

bool MetadataStore::update(const Mutator &fn, Error *err) {
  auto dir = std::filesystem::path(path_).parent_path().string();
  if (!dir.empty() && !ensure_dir(dir, err))
    return false;
  FileLock lock(lock_path());
  if (!lock.acquire(true, err))
    return false;
  nlohmann::json doc;
  bool recovered = false;
  if (!load_unlocked(&doc, &recovered, err))
    return false;
  const nlohmann::json before = doc;
  if (!fn(doc, err))
    return false;
  if (doc == before && !recovered)
    return true;
  return store_unlocked(doc, err);
}

bool MetadataStore::load_unlocked(nlohmann::json *out, bool *recovered,
                                  Error *err) const {
  Bytes raw;
  Error read_err;
  if (!read_file(path_, &raw, &read_err)) {
    if (read_err.kind == ErrorKind::NotFound) {
      *out = empty_document_;
      return true;
    }
    if (err)
      *err = read_err;
    return false;
  }
  if (raw.empty()) {
    *out = empty_document_;
    return true;
  }
  auto doc = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    if (recover_corrupt_) {
      MV_LOG_WARN("metadata document unreadable, starting empty",
                  {StringField("path", path_)});
      *out = empty_document_;
      *recovered = true;
      return true;
    }
    MV_LOG_ERROR("metadata document unreadable", {StringField("path", path_)});
    return fail(err, ErrorKind::SerializationError,
                "metadata document is not a JSON object: " + path_);
  }
  *out = std::move(doc);
  return true;
}

bool MetadataStore::store_unlocked(const nlohmann::json &doc,
                                   Error *err) const {
  return write_file_atomic(
      path_, doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
      err);
}

} // namespace model_vault
