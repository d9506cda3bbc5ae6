#pragma once

#include <stdexcept>
#include <string>

namespace projmem::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  ReadOnly,

  IOError,
  Corruption,
  NotADatabase,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Thrown by read paths, which have no Result to return.
class DbError : public std::runtime_error {
 public:
  explicit DbError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  ErrorCode code() const {
    return result_.code;
  }

 private:
  Result result_;
};

inline bool IsIntegrityFailure(ErrorCode code) {
  return code == ErrorCode::Corruption || code == ErrorCode::NotADatabase;
}

} // namespace projmem::db
