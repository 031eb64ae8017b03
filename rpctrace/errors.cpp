#include "errors.hpp"
#include <fmt/format.h>

namespace rpctrace {

Status make_status(StatusCode code, std::string const& why) {
  Status status;
  status.set_code(code);
  status.set_why(why);
  return status;
}

Error Error::from_status(Status const& status) {
  Error error;
  error.error_kind = Kind::status;
  error.stat = status;
  error.msg = status.why();
  return error;
}

Error Error::from_error_code(std::error_code const& code) {
  Error error;
  error.error_kind = Kind::error_code;
  error.ec = code;
  error.msg = code.message();
  return error;
}

Error Error::unknown(std::string const& message) {
  Error error;
  error.error_kind = Kind::unknown;
  error.msg = message;
  return error;
}

std::string Error::message() const {
  switch (error_kind) {
    case Kind::none: return "";
    case Kind::status:
      return msg.empty() ? StatusCode_Name(stat->code())
                         : fmt::format("{}: {}", StatusCode_Name(stat->code()), msg);
    case Kind::error_code:
      return fmt::format("{}: {}", ec.category().name(), msg);
    case Kind::unknown: return msg;
  }
  return msg;
}

bool operator==(Error const& lhs, Error const& rhs) {
  if (lhs.error_kind != rhs.error_kind) return false;
  switch (lhs.error_kind) {
    case Error::Kind::none: return true;
    case Error::Kind::status:
      return lhs.stat->code() == rhs.stat->code() &&
             lhs.stat->why() == rhs.stat->why();
    case Error::Kind::error_code: return lhs.ec == rhs.ec;
    case Error::Kind::unknown: return lhs.msg == rhs.msg;
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, Error const& error) {
  return os << (error ? error.message() : "OK");
}

StatusException::StatusException(Status const& status)
    : std::runtime_error(status.why().empty() ? StatusCode_Name(status.code())
                                              : status.why()),
      stat(status) {}

}  // namespace rpctrace
