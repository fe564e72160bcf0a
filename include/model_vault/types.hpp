#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace model_vault {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;

enum class ErrorKind {
  None,
  NotFound,
  IntegrityViolation,
  InvalidOperation,
  SerializationError,
  IOFailure
};

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;
};

const char *error_kind_name(ErrorKind kind);

// Fills *err when err is non-null and always returns false so call sites
// can write `return fail(err, ...)`.
bool fail(Error *err, ErrorKind kind, std::string message);

inline std::uint64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          t.time_since_epoch())
          .count());
}

inline std::uint64_t now_ms() { return to_epoch_ms(Clock::now()); }

} // namespace model_vault
