#include "model_vault/blob_io.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace model_vault {
namespace {
bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

std::string parent_dir(const std::string &path) {
  auto parent = std::filesystem::path(path).parent_path();
  return parent.empty() ? std::string(".") : parent.string();
}

std::string errno_text() { return std::strerror(errno); }

bool write_all(int fd, const std::uint8_t *data, std::size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, data, len);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += w;
    len -= static_cast<std::size_t>(w);
  }
  return true;
}

bool write_atomic(const std::string &path, const std::uint8_t *data,
                  std::size_t len, Error *err) {
  const std::string dir = parent_dir(path);
  if (!ensure_dir(dir, err))
    return false;
  const std::string tmp = path + ".tmp." + std::to_string(::getpid());
  int fd = open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0)
    return fail(err, ErrorKind::IOFailure,
                "cannot create " + tmp + ": " + errno_text());
  if (!write_all(fd, data, len) || ::fsync(fd) != 0) {
    const auto msg = errno_text();
    close(fd);
    ::unlink(tmp.c_str());
    return fail(err, ErrorKind::IOFailure, "write failed " + tmp + ": " + msg);
  }
  close(fd);
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    const auto msg = errno_text();
    ::unlink(tmp.c_str());
    return fail(err, ErrorKind::IOFailure,
                "rename to " + path + " failed: " + msg);
  }
  if (!fsync_dir(dir))
    return fail(err, ErrorKind::IOFailure, "fsync failed for " + dir);
  return true;
}
} // namespace

bool read_file(const std::string &path, Bytes *out, Error *err) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    if (errno == ENOENT)
      return fail(err, ErrorKind::NotFound, "file not found: " + path);
    return fail(err, ErrorKind::IOFailure,
                "cannot open " + path + ": " + errno_text());
  }
  struct stat st {};
  if (fstat(fd, &st) != 0) {
    const auto msg = errno_text();
    close(fd);
    return fail(err, ErrorKind::IOFailure, "stat failed " + path + ": " + msg);
  }
  out->assign(static_cast<std::size_t>(st.st_size), 0);
  std::size_t off = 0;
  while (off < out->size()) {
    ssize_t r = pread(fd, out->data() + off, out->size() - off,
                      static_cast<off_t>(off));
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0) {
      const auto msg = r == 0 ? std::string("short read") : errno_text();
      close(fd);
      return fail(err, ErrorKind::IOFailure,
                  "read failed " + path + ": " + msg);
    }
    off += static_cast<std::size_t>(r);
  }
  close(fd);
  return true;
}

bool write_file_atomic(const std::string &path, const Bytes &data, Error *err) {
  return write_atomic(path, data.data(), data.size(), err);
}

bool write_file_atomic(const std::string &path, const std::string &data,
                       Error *err) {
  return write_atomic(path, reinterpret_cast<const std::uint8_t *>(data.data()),
                      data.size(), err);
}

bool copy_file_atomic(const std::string &src, const std::string &dst,
                      Error *err) {
  Bytes data;
  if (!read_file(src, &data, err))
    return false;
  return write_file_atomic(dst, data, err);
}

bool remove_file(const std::string &path, Error *err) {
  if (::unlink(path.c_str()) == 0 || errno == ENOENT)
    return true;
  return fail(err, ErrorKind::IOFailure,
              "cannot remove " + path + ": " + errno_text());
}

bool remove_tree(const std::string &path, Error *err) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec)
    return fail(err, ErrorKind::IOFailure,
                "cannot remove " + path + ": " + ec.message());
  return true;
}

bool ensure_dir(const std::string &path, Error *err) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec)
    return fail(err, ErrorKind::IOFailure,
                "cannot create directory " + path + ": " + ec.message());
  return true;
}

} // namespace model_vault
