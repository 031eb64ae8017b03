#include <catch2/catch.hpp>
#include <map>
#include "../rpctrace/tracing/carrier.hpp"
#include "mocks.hpp"

using namespace rpctrace;

namespace {

std::map<std::string, std::string> read_all(Carrier const& carrier) {
  std::map<std::string, std::string> seen;
  carrier.ForeachKey([&](ot::string_view key, ot::string_view value) -> ot::expected<void> {
    seen[std::string{key.data(), key.size()}] = std::string{value.data(), value.size()};
    return {};
  });
  return seen;
}

}  // namespace

TEST_CASE("Propagation format selection", "[carrier]") {
  REQUIRE(propagation_format("tchannel") == PropagationFormat::text_map);
  REQUIRE(propagation_format("http") == PropagationFormat::http_headers);
  REQUIRE(propagation_format("grpc") == PropagationFormat::http_headers);
  REQUIRE(propagation_format("") == PropagationFormat::http_headers);
  REQUIRE(propagation_format("carrier-pigeon") == PropagationFormat::http_headers);
}

TEST_CASE("Carrier over http headers", "[carrier]") {
  transport::Headers headers{{"X-Ot-Span-Context", "abc"}, {"rpc-caller", "me"}};

  SECTION("read view exposes every header") {
    auto carrier = Carrier::from(headers, "http");
    REQUIRE(carrier.read_only());
    auto seen = read_all(carrier);
    REQUIRE(seen.size() == 2);
    REQUIRE(seen["x-ot-span-context"] == "abc");
    REQUIRE(seen["rpc-caller"] == "me");
  }

  SECTION("read view refuses writes") {
    auto carrier = Carrier::from(headers, "http");
    REQUIRE_FALSE(carrier.Set("key", "value"));
    REQUIRE(headers.size() == 2);
  }

  SECTION("writable carrier starts empty and merges into a copy") {
    auto carrier = Carrier::make("http");
    REQUIRE_FALSE(carrier.read_only());
    REQUIRE(carrier.items().empty());
    REQUIRE(carrier.Set("Trace-Key", "v1"));

    auto merged = carrier.merge_into(headers);
    REQUIRE(merged.size() == 3);
    REQUIRE(*merged.get("trace-key") == "v1");
    REQUIRE(headers.size() == 2);
  }

  SECTION("malformed values are handed over as they are") {
    transport::Headers odd{{"x-ot-span-context", "%%% not base64 \n"}};
    auto seen = read_all(Carrier::from(odd, "grpc"));
    REQUIRE(seen["x-ot-span-context"] == "%%% not base64 \n");
  }
}

TEST_CASE("Carrier over tchannel headers", "[carrier]") {
  SECTION("only prefixed keys are visible, without the prefix") {
    transport::Headers headers{{"$tracing$uber-trace-id", "123"}, {"app-header", "x"}};
    auto seen = read_all(Carrier::from(headers, "tchannel"));
    REQUIRE(seen.size() == 1);
    REQUIRE(seen["uber-trace-id"] == "123");
  }

  SECTION("written keys get the prefix") {
    auto carrier = Carrier::make("tchannel");
    REQUIRE(carrier.Set("uber-trace-id", "123"));
    REQUIRE(carrier.items().count("$tracing$uber-trace-id") == 1);
    REQUIRE(read_all(carrier)["uber-trace-id"] == "123");
  }
}

TEST_CASE("Span context survives inject then extract", "[carrier]") {
  for (std::string name : {"http", "grpc", "tchannel"}) {
    RecordingTracer recording;
    auto parent = recording.tracer->StartSpan("parent");
    auto format = propagation_format(name);

    auto carrier = Carrier::make(name);
    REQUIRE(inject(*recording.tracer, parent->context(), format, carrier));
    parent->Finish();

    auto headers = carrier.merge_into(transport::Headers{});
    auto extracted = extract(*recording.tracer, format, Carrier::from(headers, name));
    REQUIRE(extracted);
    REQUIRE(*extracted != nullptr);

    auto child = recording.tracer->StartSpan("child", {ot::ChildOf(extracted->get())});
    child->Finish();

    auto spans = recording.spans();
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[1].span_context.trace_id == spans[0].span_context.trace_id);
    REQUIRE(spans[1].references.size() == 1);
    REQUIRE(spans[1].references[0].span_id == spans[0].span_context.span_id);
  }
}

TEST_CASE("Extraction without tracing headers finds no parent", "[carrier]") {
  RecordingTracer recording;
  transport::Headers headers{{"rpc-caller", "me"}};
  auto extracted = extract(*recording.tracer, PropagationFormat::http_headers,
                           Carrier::from(headers, "http"));
  REQUIRE(extracted);
  REQUIRE(*extracted == nullptr);
}
