#pragma once

#include <opentracing/propagation.h>
#include <opentracing/tracer.h>
#include <string>
#include "../transport/headers.hpp"

namespace rpctrace {

namespace ot = opentracing;

// Wire convention used to carry span contexts in transport headers
enum class PropagationFormat { text_map, http_headers };

// Selects the propagation format of a transport. tchannel uses text maps, every other transport
// (http, grpc and unknown ones) uses http headers.
PropagationFormat propagation_format(std::string const& transport);

// Prefix added to tracing keys on transports that share their header set with application headers
extern const std::string kTChannelTracingKeyPrefix;

// Adapts transport headers to the carrier interfaces understood by the tracer. A carrier is either
// a read only view over the headers of an incoming request, or a fresh writable map collecting the
// headers of an outgoing one. Header values are never interpreted: malformed values are handed to
// the tracer as they are.
class Carrier : public ot::HTTPHeadersReader, public ot::HTTPHeadersWriter {
  transport::Headers::Items const* view;
  mutable transport::Headers::Items written;
  std::string prefix;

  Carrier(transport::Headers::Items const* items, std::string const& transport);

 public:
  // Read view over existing headers. The headers must outlive the carrier.
  static Carrier from(transport::Headers const& headers, std::string const& transport);
  // Empty writable carrier used for injection
  static Carrier make(std::string const& transport);

  ot::expected<void> Set(ot::string_view key, ot::string_view value) const override;

  ot::expected<void> ForeachKey(
      std::function<ot::expected<void>(ot::string_view key, ot::string_view value)> f)
      const override;

  // Entries written so far, keys already carrying the transport prefix
  transport::Headers::Items const& items() const { return written; }

  // Returns a copy of the headers extended with every entry written to this carrier
  transport::Headers merge_into(transport::Headers const& headers) const;

  bool read_only() const { return view != nullptr; }
};

// Extracts a span context using the given format. An empty pointer means no usable parent.
ot::expected<std::unique_ptr<ot::SpanContext>> extract(ot::Tracer const& tracer,
                                                       PropagationFormat format,
                                                       Carrier const& carrier);

ot::expected<void> inject(ot::Tracer const& tracer, ot::SpanContext const& context,
                          PropagationFormat format, Carrier const& carrier);

}  // namespace rpctrace
