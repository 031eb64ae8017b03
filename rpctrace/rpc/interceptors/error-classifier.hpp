#pragma once

#include <opentracing/span.h>
#include <exception>
#include <string>
#include "../../errors.hpp"
#include "../../transport/response.hpp"

namespace rpctrace {

// Span tag names and values other tooling relies on. Do not change them.
extern const std::string kErrorTypeTag;
extern const std::string kStatusCodeTag;
extern const std::string kApplicationErrorType;
extern const std::string kUnknownInternalErrorType;

// Tags the span with the outcome of a call and returns the error untouched.
//  - no error: nothing is tagged;
//  - structured status: error=true, status code and error type set to the code name;
//  - any other error: error=true, error type set to kUnknownInternalErrorType.
Error tag_error(opentracing::Span& span, Error const& error);

// Inbound flavour: an application error raised by a handler that returned no error only sets the
// error type to kApplicationErrorType, the span is not marked as failed.
Error tag_inbound_error(opentracing::Span& span, Error const& error, bool application_error);

// Outbound flavour: the application error flag comes from the response, which may be absent.
// An application error with no error marks the span as failed with kApplicationErrorType.
// An explicit error always wins over the application error flag in both flavours.
Error tag_outbound_error(opentracing::Span& span, transport::Response const* response,
                         Error const& error);

// Tags a call that ended by throwing. StatusException is classified by its code.
void tag_exception(opentracing::Span& span, std::exception const& exception);

// Tags a call that ended by throwing something that is not a std::exception
void tag_unknown_exception(opentracing::Span& span);

// Records a failure on the span log as {event: error, message: ...}
void log_error_event(opentracing::Span& span, std::string const& message);

}  // namespace rpctrace
