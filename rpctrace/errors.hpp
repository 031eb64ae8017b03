#pragma once

#include <rpctrace/msgs/status.pb.h>
#include <boost/optional.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace rpctrace {

Status make_status(StatusCode code, std::string const& why = "");

// Error is the value every handler and outbound returns. A default constructed Error means the
// call succeeded. A failed call carries exactly one of:
//  - a structured status, produced by the RPC layer with a machine readable code;
//  - an error code, produced by libraries reporting through std::error_code (e.g. the tracer);
//  - a plain message, for anything else.
class Error {
 public:
  enum class Kind { none, status, error_code, unknown };

  Error() = default;

  static Error from_status(Status const& status);
  static Error from_error_code(std::error_code const& code);
  static Error unknown(std::string const& message);

  explicit operator bool() const { return error_kind != Kind::none; }
  bool ok() const { return error_kind == Kind::none; }

  Kind kind() const { return error_kind; }
  bool is_status() const { return error_kind == Kind::status; }

  // Only set when is_status()
  boost::optional<Status> const& status() const { return stat; }
  std::error_code const& error_code() const { return ec; }

  std::string message() const;

  friend bool operator==(Error const& lhs, Error const& rhs);
  friend bool operator!=(Error const& lhs, Error const& rhs) { return !(lhs == rhs); }
  friend std::ostream& operator<<(std::ostream& os, Error const& error);

 private:
  Kind error_kind = Kind::none;
  boost::optional<Status> stat;
  std::error_code ec;
  std::string msg;
};

inline Error make_error(StatusCode code, std::string const& why = "") {
  return Error::from_status(make_status(code, why));
}

// Exception counterpart of a structured status, for code paths that report failures by throwing
class StatusException : public std::runtime_error {
  Status stat;

 public:
  explicit StatusException(Status const& status);
  Status const& status() const { return stat; }
};

}  // namespace rpctrace
