#include "model_vault/types.hpp"

#include <utility>

namespace model_vault {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::IntegrityViolation:
    return "IntegrityViolation";
  case ErrorKind::InvalidOperation:
    return "InvalidOperation";
  case ErrorKind::SerializationError:
    return "SerializationError";
  case ErrorKind::IOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

bool fail(Error *err, ErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
  return false;
}

} // namespace model_vault
