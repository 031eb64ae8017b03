#pragma once

#include <memory>
#include "../transport/handler.hpp"
#include "../transport/outbound.hpp"
#include "context.hpp"

namespace rpctrace {

// Interceptors customize the behaviour of inbound handlers and outbounds by sitting between the
// transport and the wrapped call. An interceptor is re-used across requests: implementations MUST
// be thread-safe and MUST always return either the wrapped call's result or an error.
// Which interceptors run, and in what order, is decided by whoever composes them.

struct UnaryInbound {
  virtual ~UnaryInbound() {}
  virtual Error handle(Context const& ctx, transport::Request const& request,
                       transport::ResponseWriter& writer, transport::UnaryHandler& next) = 0;
};

// Outbound interceptors MAY call the given outbound zero or more times on the same request
struct UnaryOutbound {
  virtual ~UnaryOutbound() {}
  virtual Error call(Context const& ctx, transport::Request const& request,
                     transport::Response* response, transport::UnaryOutbound& next) = 0;
};

struct OnewayInbound {
  virtual ~OnewayInbound() {}
  virtual Error handle_oneway(Context const& ctx, transport::Request const& request,
                              transport::OnewayHandler& next) = 0;
};

struct OnewayOutbound {
  virtual ~OnewayOutbound() {}
  virtual Error call_oneway(Context const& ctx, transport::Request const& request,
                            transport::Ack* ack, transport::OnewayOutbound& next) = 0;
};

struct StreamInbound {
  virtual ~StreamInbound() {}
  virtual Error handle_stream(transport::ServerStream& stream, transport::StreamHandler& next) = 0;
};

struct StreamOutbound {
  virtual ~StreamOutbound() {}
  virtual Error call_stream(Context const& ctx, transport::StreamRequest const& request,
                            std::unique_ptr<transport::ClientStream>* stream,
                            transport::StreamOutbound& next) = 0;
};

// The apply functions bind an interceptor in front of a handler or outbound, producing something
// a transport can use in place of the original. Both arguments must outlive the result.

std::unique_ptr<transport::UnaryHandler> apply(UnaryInbound& interceptor,
                                               transport::UnaryHandler& handler);
std::unique_ptr<transport::OnewayHandler> apply(OnewayInbound& interceptor,
                                                transport::OnewayHandler& handler);
std::unique_ptr<transport::StreamHandler> apply(StreamInbound& interceptor,
                                                transport::StreamHandler& handler);

std::unique_ptr<transport::UnaryOutbound> apply(UnaryOutbound& interceptor,
                                                transport::UnaryOutbound& outbound);
std::unique_ptr<transport::OnewayOutbound> apply(OnewayOutbound& interceptor,
                                                 transport::OnewayOutbound& outbound);
std::unique_ptr<transport::StreamOutbound> apply(StreamOutbound& interceptor,
                                                 transport::StreamOutbound& outbound);

}  // namespace rpctrace
