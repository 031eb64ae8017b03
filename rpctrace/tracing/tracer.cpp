#include "tracer.hpp"
#include <zipkin/opentracing.h>
#include "../logger.hpp"

namespace rpctrace {

std::shared_ptr<opentracing::Tracer> make_zipkin_tracer(ZipkinOptions const& options) {
  zipkin::ZipkinOtTracerOptions zipkin_options;
  zipkin_options.collector_host = options.host;
  zipkin_options.collector_port = options.port;
  zipkin_options.service_name = options.service_name;
  zipkin_options.sample_rate = options.sample_rate;
  info("Reporting spans of '{}' to zipkin at {}:{}", options.service_name, options.host,
       options.port);
  return zipkin::makeZipkinOtTracer(zipkin_options);
}

}  // namespace rpctrace
