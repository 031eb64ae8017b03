#pragma once

#include <string>
#include "headers.hpp"

namespace rpctrace {
namespace transport {

// Request is the low level request representation shared by every call shape
struct Request {
  // Name of the service making the request
  std::string caller;
  // Name of the service to which the request is being made
  std::string service;
  // Name of the transport the request travels on (e.g. "http", "tchannel", "grpc")
  std::string transport;
  std::string encoding;
  // Name of the procedure being called
  std::string procedure;
  std::string shard_key;
  std::string routing_key;
  std::string routing_delegate;

  Headers headers;
  std::string body;
};

// Metadata describing a stream, sent once when the stream is opened
struct StreamRequest {
  Request meta;
};

}  // namespace transport
}  // namespace rpctrace
