#pragma once

#include <string>
#include "../errors.hpp"
#include "../rpc/context.hpp"
#include "request.hpp"

namespace rpctrace {
namespace transport {

// Server side of a stream, handed by the transport to the stream handler
class ServerStream {
 public:
  virtual ~ServerStream() {}

  virtual Context const& context() const = 0;
  virtual StreamRequest const& request() const = 0;

  virtual Error send_message(std::string const& body) = 0;
  // Fills body with the next message. Returns an error once the stream is exhausted.
  virtual Error receive_message(std::string* body) = 0;
};

// Client side of a stream, returned by stream outbounds
class ClientStream {
 public:
  virtual ~ClientStream() {}

  virtual Context const& context() const = 0;
  virtual StreamRequest const& request() const = 0;

  virtual Error send_message(std::string const& body) = 0;
  virtual Error receive_message(std::string* body) = 0;
  virtual Error close() = 0;
};

}  // namespace transport
}  // namespace rpctrace
