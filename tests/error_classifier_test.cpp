#include <catch2/catch.hpp>
#include "../rpctrace/rpc/interceptors/error-classifier.hpp"
#include "mocks.hpp"

using namespace rpctrace;

namespace {

// Runs the classification on a fresh span and returns the recorded span
template <typename F>
mt::SpanData classify(F&& f) {
  RecordingTracer recording;
  auto span = recording.tracer->StartSpan("call");
  f(*span);
  span->Finish();
  return recording.last();
}

}  // namespace

TEST_CASE("Successful outcomes are not tagged", "[classifier]") {
  auto span = classify([](opentracing::Span& s) { REQUIRE(tag_error(s, Error{}).ok()); });
  REQUIRE_FALSE(has_tag(span, "error"));
  REQUIRE_FALSE(has_tag(span, kErrorTypeTag));
  REQUIRE_FALSE(has_tag(span, kStatusCodeTag));

  transport::Response response;
  span = classify([&](opentracing::Span& s) { tag_outbound_error(s, &response, Error{}); });
  REQUIRE_FALSE(has_tag(span, "error"));

  span = classify([](opentracing::Span& s) { tag_outbound_error(s, nullptr, Error{}); });
  REQUIRE_FALSE(has_tag(span, "error"));
}

TEST_CASE("Structured statuses are tagged by code name", "[classifier]") {
  auto code = GENERATE(StatusCode::INTERNAL, StatusCode::NOT_FOUND, StatusCode::DEADLINE_EXCEEDED,
                       StatusCode::UNAUTHENTICATED, StatusCode::CANCELLED);
  auto error = make_error(code, "boom");

  auto span = classify([&](opentracing::Span& s) { REQUIRE(tag_error(s, error) == error); });
  REQUIRE(error_tag(span));
  REQUIRE(string_tag(span, kErrorTypeTag) == StatusCode_Name(code));
  REQUIRE(string_tag(span, kStatusCodeTag) == StatusCode_Name(code));
}

TEST_CASE("Unrecognized errors are unknown internal errors", "[classifier]") {
  auto error = GENERATE(Error::unknown("socket closed"),
                        Error::from_error_code(std::make_error_code(std::errc::timed_out)));

  auto span = classify([&](opentracing::Span& s) { REQUIRE(tag_error(s, error) == error); });
  REQUIRE(error_tag(span));
  REQUIRE(string_tag(span, kErrorTypeTag) == "unknown_internal_yarpc");
  REQUIRE_FALSE(has_tag(span, kStatusCodeTag));
}

TEST_CASE("Application errors", "[classifier]") {
  transport::Response response;
  response.application_error = true;

  SECTION("are tagged when nothing else failed") {
    auto span = classify(
        [&](opentracing::Span& s) { REQUIRE(tag_outbound_error(s, &response, Error{}).ok()); });
    REQUIRE(error_tag(span));
    REQUIRE(string_tag(span, kErrorTypeTag) == "application_error");
    REQUIRE_FALSE(has_tag(span, kStatusCodeTag));
  }

  SECTION("never override a structured status") {
    auto error = make_error(StatusCode::INTERNAL);
    auto span = classify([&](opentracing::Span& s) { tag_outbound_error(s, &response, error); });
    REQUIRE(string_tag(span, kErrorTypeTag) == "INTERNAL");
    REQUIRE(string_tag(span, kStatusCodeTag) == "INTERNAL");
  }

  SECTION("never override an unrecognized error") {
    auto span = classify(
        [&](opentracing::Span& s) { tag_outbound_error(s, &response, Error::unknown("x")); });
    REQUIRE(string_tag(span, kErrorTypeTag) == "unknown_internal_yarpc");
  }

  SECTION("raised by inbound handlers") {
    auto span = classify([](opentracing::Span& s) {
      REQUIRE(tag_inbound_error(s, Error{}, true).ok());
    });
    REQUIRE_FALSE(has_tag(span, "error"));
    REQUIRE(string_tag(span, kErrorTypeTag) == "application_error");
    REQUIRE_FALSE(has_tag(span, kStatusCodeTag));
  }
}

TEST_CASE("Exceptions", "[classifier]") {
  SECTION("carrying a status are tagged by code name") {
    StatusException exception(make_status(StatusCode::ABORTED, "conflict"));
    auto span = classify([&](opentracing::Span& s) { tag_exception(s, exception); });
    REQUIRE(error_tag(span));
    REQUIRE(string_tag(span, kErrorTypeTag) == "ABORTED");
    REQUIRE(string_tag(span, kStatusCodeTag) == "ABORTED");
    REQUIRE(span.logs.size() == 1);
  }

  SECTION("of any other kind are unknown internal errors") {
    std::runtime_error exception("bad things");
    auto span = classify([&](opentracing::Span& s) { tag_exception(s, exception); });
    REQUIRE(error_tag(span));
    REQUIRE(string_tag(span, kErrorTypeTag) == "unknown_internal_yarpc");
    REQUIRE(span.logs.size() == 1);
    REQUIRE(span.logs[0].fields.size() == 2);
    REQUIRE(span.logs[0].fields[1].second.get<std::string>() == "bad things");
  }
}

TEST_CASE("Non standard exceptions are unknown internal errors", "[classifier]") {
  auto span = classify([](opentracing::Span& s) { tag_unknown_exception(s); });
  REQUIRE(error_tag(span));
  REQUIRE(string_tag(span, kErrorTypeTag) == "unknown_internal_yarpc");
  REQUIRE_FALSE(has_tag(span, kStatusCodeTag));
  REQUIRE(span.logs.size() == 1);
}
