#include "error-classifier.hpp"
#include <opentracing/ext/tags.h>

namespace rpctrace {

const std::string kErrorTypeTag = "error.type";
const std::string kStatusCodeTag = "rpc.yarpc.status_code";
const std::string kApplicationErrorType = "application_error";
const std::string kUnknownInternalErrorType = "unknown_internal_yarpc";

namespace {

void tag_status(opentracing::Span& span, Status const& status) {
  auto code = StatusCode_Name(status.code());
  span.SetTag(kStatusCodeTag, code);
  span.SetTag(kErrorTypeTag, code);
}

}  // namespace

Error tag_error(opentracing::Span& span, Error const& error) {
  if (!error) return error;

  span.SetTag(opentracing::ext::error, true);
  if (error.is_status()) {
    tag_status(span, *error.status());
  } else {
    span.SetTag(kErrorTypeTag, kUnknownInternalErrorType);
  }
  return error;
}

Error tag_inbound_error(opentracing::Span& span, Error const& error, bool application_error) {
  if (!error && application_error) span.SetTag(kErrorTypeTag, kApplicationErrorType);
  return tag_error(span, error);
}

Error tag_outbound_error(opentracing::Span& span, transport::Response const* response,
                         Error const& error) {
  auto application_error = response != nullptr && response->application_error;
  if (!error && application_error) {
    span.SetTag(opentracing::ext::error, true);
    span.SetTag(kErrorTypeTag, kApplicationErrorType);
  }
  return tag_error(span, error);
}

void tag_exception(opentracing::Span& span, std::exception const& exception) {
  span.SetTag(opentracing::ext::error, true);
  auto status_exception = dynamic_cast<StatusException const*>(&exception);
  if (status_exception != nullptr) {
    tag_status(span, status_exception->status());
  } else {
    span.SetTag(kErrorTypeTag, kUnknownInternalErrorType);
  }
  log_error_event(span, exception.what());
}

void tag_unknown_exception(opentracing::Span& span) {
  span.SetTag(opentracing::ext::error, true);
  span.SetTag(kErrorTypeTag, kUnknownInternalErrorType);
  log_error_event(span, "unknown exception");
}

void log_error_event(opentracing::Span& span, std::string const& message) {
  span.Log({{"event", std::string{"error"}}, {"message", message}});
}

}  // namespace rpctrace
