#include "carrier.hpp"

namespace rpctrace {

const std::string kTChannelTracingKeyPrefix = "$tracing$";

PropagationFormat propagation_format(std::string const& transport) {
  if (transport == "tchannel") return PropagationFormat::text_map;
  return PropagationFormat::http_headers;
}

Carrier::Carrier(transport::Headers::Items const* items, std::string const& transport)
    : view(items),
      prefix(transport == "tchannel" ? kTChannelTracingKeyPrefix : std::string{}) {}

Carrier Carrier::from(transport::Headers const& headers, std::string const& transport) {
  return Carrier(&headers.items(), transport);
}

Carrier Carrier::make(std::string const& transport) {
  return Carrier(nullptr, transport);
}

ot::expected<void> Carrier::Set(ot::string_view key, ot::string_view value) const {
  if (view != nullptr) return ot::make_unexpected(ot::invalid_carrier_error);
  written[transport::canonicalize_header_key(prefix + static_cast<std::string>(key))] =
      static_cast<std::string>(value);
  return {};
}

ot::expected<void> Carrier::ForeachKey(
    std::function<ot::expected<void>(ot::string_view key, ot::string_view value)> f) const {
  auto const& entries = view != nullptr ? *view : written;
  for (auto const& key_value : entries) {
    auto const& key = key_value.first;
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    auto result = f(ot::string_view{key.data() + prefix.size(), key.size() - prefix.size()},
                    key_value.second);
    if (!result) return result;
  }
  return {};
}

transport::Headers Carrier::merge_into(transport::Headers const& headers) const {
  auto merged = headers;
  for (auto const& key_value : written)
    merged = merged.with(key_value.first, key_value.second);
  return merged;
}

ot::expected<std::unique_ptr<ot::SpanContext>> extract(ot::Tracer const& tracer,
                                                       PropagationFormat format,
                                                       Carrier const& carrier) {
  if (format == PropagationFormat::text_map) {
    return tracer.Extract(static_cast<ot::TextMapReader const&>(carrier));
  }
  return tracer.Extract(static_cast<ot::HTTPHeadersReader const&>(carrier));
}

ot::expected<void> inject(ot::Tracer const& tracer, ot::SpanContext const& context,
                          PropagationFormat format, Carrier const& carrier) {
  if (format == PropagationFormat::text_map) {
    return tracer.Inject(context, static_cast<ot::TextMapWriter const&>(carrier));
  }
  return tracer.Inject(context, static_cast<ot::HTTPHeadersWriter const&>(carrier));
}

}  // namespace rpctrace
