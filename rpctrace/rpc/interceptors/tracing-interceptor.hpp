#pragma once

#include <opentracing/tracer.h>
#include <memory>
#include <string>
#include "../../tracing/carrier.hpp"
#include "../../tracing/span-factory.hpp"
#include "../interceptor.hpp"

namespace rpctrace {

// Tags added to every span started by the tracing interceptor
Tags const& common_tracing_tags();

// TracingInterceptor attaches a span to every call going through it, for every call shape and in
// both directions, and propagates the trace context across process boundaries:
//  - inbound calls extract the parent context from the request headers before the handler runs;
//  - outbound calls inject the context of their span into the request headers before sending.
// The span is finished when the wrapped call returns, whichever way it returns. Errors returned or
// thrown downstream are tagged on the span and handed back to the caller unchanged.
//
// The interceptor holds no per call state and can be shared by any number of concurrent calls.
class TracingInterceptor : public UnaryInbound,
                           public UnaryOutbound,
                           public OnewayInbound,
                           public OnewayOutbound,
                           public StreamInbound,
                           public StreamOutbound {
 public:
  struct Params {
    // When empty the global tracer is used, resolved once at construction
    std::shared_ptr<opentracing::Tracer> tracer;
    // Transport of the outbounds this interceptor wraps; selects the propagation format
    std::string transport;
  };

  explicit TracingInterceptor(Params const& params);

  Error handle(Context const& ctx, transport::Request const& request,
               transport::ResponseWriter& writer, transport::UnaryHandler& next) override;

  Error call(Context const& ctx, transport::Request const& request, transport::Response* response,
             transport::UnaryOutbound& next) override;

  Error handle_oneway(Context const& ctx, transport::Request const& request,
                      transport::OnewayHandler& next) override;

  Error call_oneway(Context const& ctx, transport::Request const& request, transport::Ack* ack,
                    transport::OnewayOutbound& next) override;

  Error handle_stream(transport::ServerStream& stream, transport::StreamHandler& next) override;

  Error call_stream(Context const& ctx, transport::StreamRequest const& request,
                    std::unique_ptr<transport::ClientStream>* stream,
                    transport::StreamOutbound& next) override;

  opentracing::Tracer const& get_tracer() const { return spans.get_tracer(); }
  std::string const& get_transport() const { return transport_name; }
  PropagationFormat get_format() const { return spans.get_format(); }

 private:
  template <typename Downstream>
  Error inbound(Context const& ctx, transport::Request const& request, Downstream&& downstream);

  template <typename Downstream>
  Error outbound(Context const& ctx, transport::Request const& request, Downstream&& downstream);

  std::string transport_name;
  SpanFactory spans;
};

}  // namespace rpctrace
