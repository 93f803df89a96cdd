#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace airtime::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace airtime::db
