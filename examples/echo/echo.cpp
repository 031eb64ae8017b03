#include <rpctrace/cli.hpp>
#include <rpctrace/core.hpp>
#include <rpctrace/rpc/interceptors/tracing-interceptor.hpp>
#include <rpctrace/tracing/tracer.hpp>

using rpctrace::Context;
using rpctrace::Error;
namespace transport = rpctrace::transport;

/* @Traced echo service. This example describes how to:
  - Build a tracer reporting to zipkin;
  - Wrap a handler and an outbound with the tracing interceptor;
  - Follow a request across the client and server spans of a single trace.

  The client and the service live in the same process and talk through a loopback outbound that
  stands in for a real transport:
  $ ./rpctrace-echo --zipkin-host localhost --message "Winter is coming"
  or
  $ RPCTRACE_ZIPKIN_HOST=localhost ./rpctrace-echo
*/

// Collects what the handler writes so it can be turned into a response
class BufferWriter : public transport::ResponseWriter,
                     public transport::ApplicationErrorMetaSetter {
 public:
  transport::Response response;

  Error write(std::string const& data) override {
    response.body += data;
    return Error{};
  }

  void add_headers(transport::Headers const& headers) override {
    for (auto&& header : headers.items())
      response.headers.set(header.first, header.second);
  }

  void set_application_error() override { response.application_error = true; }

  void set_application_error_meta(transport::ApplicationErrorMeta const& meta) override {
    response.application_error_meta = meta;
  }
};

// Delivers requests straight to an inbound handler, as a transport would after a network hop
class LoopbackOutbound : public transport::UnaryOutbound {
  transport::UnaryHandler& handler;
  std::string name;

 public:
  LoopbackOutbound(transport::UnaryHandler& h, std::string const& transport)
      : handler(h), name(transport) {}

  Error call(Context const& ctx, transport::Request const& request,
             transport::Response* response) override {
    auto inbound = request;
    inbound.transport = name;

    BufferWriter writer;
    // Spans do not cross process boundaries, only the headers do
    auto error = handler.handle(Context{}, inbound, writer);
    if (error.is_status()) {
      writer.response.headers.set("rpc-status", rpctrace::to_json(*error.status()));
    }
    *response = writer.response;
    return error;
  }
};

int main(int argc, char** argv) {
  std::string transport_name, message, zipkin_host;
  uint32_t zipkin_port;
  int count;

  rpctrace::po::options_description opts("Options");
  auto opt_add = opts.add_options();
  opt_add("transport,t", rpctrace::po::value<std::string>(&transport_name)->default_value("http"),
          "transport name, selects the propagation format: http, grpc or tchannel");
  opt_add("message,m", rpctrace::po::value<std::string>(&message)->default_value("hello"),
          "message to echo, an empty message is rejected by the service");
  opt_add("count,c", rpctrace::po::value<int>(&count)->default_value(1), "number of requests");
  opt_add("zipkin-host", rpctrace::po::value<std::string>(&zipkin_host)->default_value("localhost"),
          "zipkin collector host");
  opt_add("zipkin-port", rpctrace::po::value<uint32_t>(&zipkin_port)->default_value(9411),
          "zipkin collector port");
  rpctrace::parse_program_options(argc, argv, opts);

  rpctrace::ZipkinOptions zipkin;
  zipkin.service_name = "echo";
  zipkin.host = zipkin_host;
  zipkin.port = zipkin_port;
  auto tracer = rpctrace::make_zipkin_tracer(zipkin);

  rpctrace::TracingInterceptor server_interceptor({tracer, transport_name});
  rpctrace::TracingInterceptor client_interceptor({tracer, transport_name});

  transport::UnaryHandlerFunc echo([](Context const& ctx, transport::Request const& request,
                                      transport::ResponseWriter& writer) {
    if (request.body.empty()) {
      writer.set_application_error();
      return Error{};
    }
    if (ctx.deadline_exceeded()) {
      return rpctrace::make_error(rpctrace::StatusCode::DEADLINE_EXCEEDED, "too late to echo");
    }
    return writer.write(request.body);
  });

  auto handler = rpctrace::apply(static_cast<rpctrace::UnaryInbound&>(server_interceptor), echo);
  LoopbackOutbound loopback(*handler, transport_name);
  auto outbound =
      rpctrace::apply(static_cast<rpctrace::UnaryOutbound&>(client_interceptor), loopback);

  for (int i = 0; i < count; ++i) {
    transport::Request request;
    request.caller = rpctrace::hostname();
    request.service = "echo";
    request.encoding = "raw";
    request.procedure = "Echo";
    request.headers.set("rpc-request-id", rpctrace::make_random_uid());
    request.body = message;

    transport::Response response;
    auto error = outbound->call(Context{}, request, &response);
    if (error) {
      rpctrace::error("Echo failed: {}", error.message());
    } else if (response.application_error) {
      rpctrace::warn("Echo rejected the request");
    } else {
      rpctrace::info("Reply: '{}'", response.body);
    }
  }

  tracer->Close();
}
