#pragma once

#include <opentracing/tracer.h>
#include <cstdint>
#include <memory>
#include <string>

namespace rpctrace {

struct ZipkinOptions {
  // Name the spans are reported under
  std::string service_name;
  std::string host = "localhost";
  uint32_t port = 9411;
  // Fraction of traces kept, between 0 and 1
  double sample_rate = 1.0;
};

// Builds an OpenTracing tracer reporting to a Zipkin collector. Call Close() on the returned
// tracer before exiting to flush buffered spans.
std::shared_ptr<opentracing::Tracer> make_zipkin_tracer(ZipkinOptions const& options);

}  // namespace rpctrace
