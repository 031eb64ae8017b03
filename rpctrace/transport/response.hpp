#pragma once

#include <boost/optional.hpp>
#include <string>
#include "../errors.hpp"
#include "headers.hpp"

namespace rpctrace {
namespace transport {

// Details of an application error, set by encodings able to describe one
struct ApplicationErrorMeta {
  std::string details;
  std::string name;
  boost::optional<StatusCode> code;
};

struct Response {
  Headers headers;
  std::string body;
  // The call succeeded at the transport level but the payload describes a business failure
  bool application_error = false;
  boost::optional<ApplicationErrorMeta> application_error_meta;
};

// Acknowledgement returned by oneway outbounds once the request has been handed to the transport
struct Ack {
  std::string description;
};

// Surface through which inbound unary handlers produce their response
class ResponseWriter {
 public:
  virtual ~ResponseWriter() {}

  // Appends data to the response body
  virtual Error write(std::string const& data) = 0;

  virtual void add_headers(Headers const& headers) = 0;

  // Marks the response as an application error
  virtual void set_application_error() = 0;
};

// Optional capability of a ResponseWriter able to carry application error details
class ApplicationErrorMetaSetter {
 public:
  virtual ~ApplicationErrorMetaSetter() {}
  virtual void set_application_error_meta(ApplicationErrorMeta const& meta) = 0;
};

}  // namespace transport
}  // namespace rpctrace
