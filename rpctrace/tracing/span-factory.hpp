#pragma once

#include <opentracing/span.h>
#include <opentracing/tracer.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../rpc/context.hpp"
#include "../transport/request.hpp"
#include "carrier.hpp"

namespace rpctrace {

using Tags = std::vector<std::pair<std::string, std::string>>;

// Attributes stamped on every span started by the factory
struct SpanOptions {
  // Transport name recorded on the span
  std::string transport;
  SystemTime start_time;
  // Static tags added verbatim to the span
  Tags extra_tags;
};

// A freshly started span and the context that carries it
struct StartedSpan {
  Context context;
  std::shared_ptr<ot::Span> span;
};

// Starts the spans of inbound and outbound calls. Never returns an empty span: if the tracer
// fails to produce one a no-op span is returned instead.
class SpanFactory {
  std::shared_ptr<ot::Tracer> tracer;
  PropagationFormat format;

 public:
  SpanFactory(std::shared_ptr<ot::Tracer> const& tracer, PropagationFormat format);

  // Inbound calls. The parent is extracted from the carrier; when extraction fails or finds
  // nothing the span becomes the root of a new trace.
  StartedSpan start_server_span(Context const& ctx, Carrier const& carrier,
                                transport::Request const& request,
                                SpanOptions const& options) const;

  // Outbound calls. No extraction happens, the parent is the span active in ctx, if any.
  StartedSpan start_client_span(Context const& ctx, transport::Request const& request,
                                SpanOptions const& options) const;

  ot::Tracer const& get_tracer() const { return *tracer; }
  PropagationFormat get_format() const { return format; }
};

}  // namespace rpctrace
