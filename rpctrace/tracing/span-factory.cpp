#include "span-factory.hpp"
#include <opentracing/ext/tags.h>
#include <opentracing/noop.h>

namespace rpctrace {

namespace {

ot::StartSpanOptions make_span_options(transport::Request const& request,
                                       SpanOptions const& options, ot::string_view kind) {
  ot::StartSpanOptions span_options;
  span_options.start_system_timestamp = options.start_time;
  span_options.start_steady_timestamp = ot::SteadyClock::now();

  auto& tags = span_options.tags;
  tags.emplace_back("rpc.caller", request.caller);
  tags.emplace_back("rpc.service", request.service);
  tags.emplace_back("rpc.encoding", request.encoding);
  tags.emplace_back("rpc.transport", options.transport);
  tags.emplace_back(static_cast<std::string>(ot::ext::span_kind), static_cast<std::string>(kind));
  tags.emplace_back(static_cast<std::string>(ot::ext::component), std::string{"yarpc"});
  for (auto const& tag : options.extra_tags)
    tags.emplace_back(tag.first, tag.second);
  return span_options;
}

StartedSpan start_span(ot::Tracer const& tracer, Context const& ctx,
                       transport::Request const& request, ot::StartSpanOptions const& options) {
  std::shared_ptr<ot::Span> span = tracer.StartSpanWithOptions(request.procedure, options);
  if (span == nullptr) {
    static auto const noop = ot::MakeNoopTracer();
    warn("Tracer failed to start span for '{}', using a no-op span", request.procedure);
    span = noop->StartSpanWithOptions(request.procedure, options);
  }
  return StartedSpan{ctx.with_span(span), span};
}

}  // namespace

SpanFactory::SpanFactory(std::shared_ptr<ot::Tracer> const& t, PropagationFormat f)
    : tracer(t), format(f) {}

StartedSpan SpanFactory::start_server_span(Context const& ctx, Carrier const& carrier,
                                           transport::Request const& request,
                                           SpanOptions const& options) const {
  auto span_options = make_span_options(request, options, ot::ext::span_kind_rpc_server);

  auto maybe_parent = extract(*tracer, format, carrier);
  if (!maybe_parent) {
    debug("Failed to extract span context for '{}': {}, starting a new trace", request.procedure,
          maybe_parent.error().message());
  } else if (*maybe_parent != nullptr) {
    span_options.references.emplace_back(ot::SpanReferenceType::ChildOfRef,
                                         maybe_parent->get());
  }

  // The parent context is only read while the span is being started
  return start_span(*tracer, ctx, request, span_options);
}

StartedSpan SpanFactory::start_client_span(Context const& ctx, transport::Request const& request,
                                           SpanOptions const& options) const {
  auto span_options = make_span_options(request, options, ot::ext::span_kind_rpc_client);
  if (ctx.span() != nullptr) {
    span_options.references.emplace_back(ot::SpanReferenceType::ChildOfRef,
                                         &ctx.span()->context());
  }
  return start_span(*tracer, ctx, request, span_options);
}

}  // namespace rpctrace
