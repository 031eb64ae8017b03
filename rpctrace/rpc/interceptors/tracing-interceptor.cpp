#include "tracing-interceptor.hpp"
#include "error-classifier.hpp"
#include "response-observer.hpp"

namespace rpctrace {

namespace {

std::shared_ptr<opentracing::Tracer> resolve_tracer(
    std::shared_ptr<opentracing::Tracer> const& tracer) {
  if (tracer != nullptr) return tracer;
  debug("No tracer configured, using the global tracer");
  return opentracing::Tracer::Global();
}

SpanOptions span_options(std::string const& transport) {
  return SpanOptions{transport, current_time(), common_tracing_tags()};
}

// Finishes the span when the call leaves the interceptor, however it leaves
class ScopedSpan {
  std::shared_ptr<opentracing::Span> span;

 public:
  explicit ScopedSpan(std::shared_ptr<opentracing::Span> const& s) : span(s) {}
  ScopedSpan(ScopedSpan const&) = delete;
  ScopedSpan& operator=(ScopedSpan const&) = delete;
  ~ScopedSpan() { span->Finish(); }

  opentracing::Span& operator*() const { return *span; }
};

// Runs the downstream call, tagging the span before letting any exception through
template <typename F>
Error guarded(opentracing::Span& span, F&& f) {
  try {
    return f();
  } catch (std::exception const& e) {
    tag_exception(span, e);
    throw;
  } catch (...) {
    tag_unknown_exception(span);
    throw;
  }
}

// Presents a server stream under the context carrying the span of the call
class TracedServerStream : public transport::ServerStream {
  transport::ServerStream& stream;
  Context ctx;

 public:
  TracedServerStream(transport::ServerStream& s, Context const& c) : stream(s), ctx(c) {}

  Context const& context() const override { return ctx; }
  transport::StreamRequest const& request() const override { return stream.request(); }
  Error send_message(std::string const& body) override { return stream.send_message(body); }
  Error receive_message(std::string* body) override { return stream.receive_message(body); }
};

}  // namespace

Tags const& common_tracing_tags() {
  static Tags const tags{{"rpc.yarpc.component", "core"}, {"rpc.yarpc.version", RPCTRACE_VERSION}};
  return tags;
}

TracingInterceptor::TracingInterceptor(Params const& params)
    : transport_name(params.transport),
      spans(resolve_tracer(params.tracer), propagation_format(params.transport)) {}

template <typename Downstream>
Error TracingInterceptor::inbound(Context const& ctx, transport::Request const& request,
                                  Downstream&& downstream) {
  auto carrier = Carrier::from(request.headers, request.transport);
  auto started = spans.start_server_span(ctx, carrier, request, span_options(request.transport));
  ScopedSpan span(started.span);

  return guarded(*span, [&] { return downstream(started.context, *span); });
}

template <typename Downstream>
Error TracingInterceptor::outbound(Context const& ctx, transport::Request const& request,
                                   Downstream&& downstream) {
  auto started = spans.start_client_span(ctx, request, span_options(transport_name));
  ScopedSpan span(started.span);

  auto carrier = Carrier::make(transport_name);
  auto injected = inject(spans.get_tracer(), (*span).context(), spans.get_format(), carrier);
  if (!injected) {
    auto error = Error::from_error_code(injected.error());
    warn("Failed to inject span context into '{}' request to '{}': {}", transport_name,
         request.procedure, error.message());
    log_error_event(*span, error.message());
    return tag_error(*span, error);
  }

  auto traced = request;
  traced.headers = carrier.merge_into(request.headers);
  return guarded(*span, [&] { return downstream(started.context, traced, *span); });
}

Error TracingInterceptor::handle(Context const& ctx, transport::Request const& request,
                                 transport::ResponseWriter& writer,
                                 transport::UnaryHandler& next) {
  return inbound(ctx, request, [&](Context const& traced_ctx, opentracing::Span& span) {
    auto observer = ResponseObserver::acquire(writer);
    auto error = next.handle(traced_ctx, request, *observer);
    error = tag_inbound_error(span, error, observer->application_error());
    observer.reset();
    return error;
  });
}

Error TracingInterceptor::call(Context const& ctx, transport::Request const& request,
                               transport::Response* response, transport::UnaryOutbound& next) {
  return outbound(ctx, request, [&](Context const& traced_ctx, transport::Request const& traced,
                                    opentracing::Span& span) {
    transport::Response discarded;
    auto out = response != nullptr ? response : &discarded;
    return tag_outbound_error(span, out, next.call(traced_ctx, traced, out));
  });
}

Error TracingInterceptor::handle_oneway(Context const& ctx, transport::Request const& request,
                                        transport::OnewayHandler& next) {
  return inbound(ctx, request, [&](Context const& traced_ctx, opentracing::Span& span) {
    return tag_error(span, next.handle_oneway(traced_ctx, request));
  });
}

Error TracingInterceptor::call_oneway(Context const& ctx, transport::Request const& request,
                                      transport::Ack* ack, transport::OnewayOutbound& next) {
  return outbound(ctx, request, [&](Context const& traced_ctx, transport::Request const& traced,
                                    opentracing::Span& span) {
    return tag_error(span, next.call_oneway(traced_ctx, traced, ack));
  });
}

Error TracingInterceptor::handle_stream(transport::ServerStream& stream,
                                        transport::StreamHandler& next) {
  auto const& request = stream.request().meta;
  return inbound(stream.context(), request,
                 [&](Context const& traced_ctx, opentracing::Span& span) {
                   TracedServerStream traced(stream, traced_ctx);
                   return tag_error(span, next.handle_stream(traced));
                 });
}

Error TracingInterceptor::call_stream(Context const& ctx, transport::StreamRequest const& request,
                                      std::unique_ptr<transport::ClientStream>* stream,
                                      transport::StreamOutbound& next) {
  return outbound(ctx, request.meta, [&](Context const& traced_ctx,
                                         transport::Request const& traced,
                                         opentracing::Span& span) {
    transport::StreamRequest traced_request{traced};
    return tag_error(span, next.call_stream(traced_ctx, traced_request, stream));
  });
}

}  // namespace rpctrace
