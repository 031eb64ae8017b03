#pragma once

#include <opentracing/mocktracer/in_memory_recorder.h>
#include <opentracing/mocktracer/tracer.h>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "../rpctrace/transport/handler.hpp"
#include "../rpctrace/transport/outbound.hpp"

namespace mt = opentracing::mocktracer;

// Mock tracer whose finished spans can be inspected
struct RecordingTracer {
  mt::InMemoryRecorder* recorder;
  std::shared_ptr<mt::MockTracer> tracer;

  explicit RecordingTracer(mt::PropagationOptions const& propagation = {}) {
    recorder = new mt::InMemoryRecorder;
    mt::MockTracerOptions options;
    options.recorder = std::unique_ptr<mt::Recorder>(recorder);
    options.propagation_options = propagation;
    tracer = std::make_shared<mt::MockTracer>(std::move(options));
  }

  std::vector<mt::SpanData> spans() const { return recorder->spans(); }
  std::size_t finished() const { return recorder->size(); }
  mt::SpanData last() const { return recorder->top(); }
};

inline bool has_tag(mt::SpanData const& span, std::string const& key) {
  return span.tags.find(key) != span.tags.end();
}

inline std::string string_tag(mt::SpanData const& span, std::string const& key) {
  auto it = span.tags.find(key);
  if (it == span.tags.end() || !it->second.is<std::string>()) return "";
  return it->second.get<std::string>();
}

inline bool error_tag(mt::SpanData const& span) {
  auto it = span.tags.find("error");
  return it != span.tags.end() && it->second.is<bool>() && it->second.get<bool>();
}

inline bool has_parent(mt::SpanData const& span) {
  return !span.references.empty();
}

inline rpctrace::transport::Request make_request(std::string const& transport = "http") {
  rpctrace::transport::Request request;
  request.caller = "caller";
  request.service = "service";
  request.transport = transport;
  request.encoding = "raw";
  request.procedure = "Greeter.Hello";
  request.body = "John Snow";
  return request;
}

// Writer without the application error details capability
class RecordingWriter : public rpctrace::transport::ResponseWriter {
 public:
  std::string body;
  rpctrace::transport::Headers headers;
  int application_errors = 0;
  rpctrace::Error write_error;

  rpctrace::Error write(std::string const& data) override {
    if (write_error) return write_error;
    body += data;
    return rpctrace::Error{};
  }

  void add_headers(rpctrace::transport::Headers const& h) override {
    for (auto&& item : h.items())
      headers.set(item.first, item.second);
  }

  void set_application_error() override { ++application_errors; }
};

// Writer that can also carry application error details
class MetaRecordingWriter : public RecordingWriter,
                            public rpctrace::transport::ApplicationErrorMetaSetter {
 public:
  std::vector<rpctrace::transport::ApplicationErrorMeta> metas;

  void set_application_error_meta(rpctrace::transport::ApplicationErrorMeta const& meta) override {
    metas.push_back(meta);
  }
};

class FakeServerStream : public rpctrace::transport::ServerStream {
 public:
  rpctrace::Context ctx;
  rpctrace::transport::StreamRequest req;
  std::deque<std::string> inbox;
  std::vector<std::string> sent;

  rpctrace::Context const& context() const override { return ctx; }
  rpctrace::transport::StreamRequest const& request() const override { return req; }

  rpctrace::Error send_message(std::string const& body) override {
    sent.push_back(body);
    return rpctrace::Error{};
  }

  rpctrace::Error receive_message(std::string* body) override {
    if (inbox.empty()) return rpctrace::make_error(rpctrace::StatusCode::OUT_OF_RANGE, "EOF");
    *body = inbox.front();
    inbox.pop_front();
    return rpctrace::Error{};
  }
};

class FakeClientStream : public rpctrace::transport::ClientStream {
 public:
  rpctrace::Context ctx;
  rpctrace::transport::StreamRequest req;
  bool closed = false;

  FakeClientStream(rpctrace::Context const& c, rpctrace::transport::StreamRequest const& r)
      : ctx(c), req(r) {}

  rpctrace::Context const& context() const override { return ctx; }
  rpctrace::transport::StreamRequest const& request() const override { return req; }
  rpctrace::Error send_message(std::string const&) override { return rpctrace::Error{}; }
  rpctrace::Error receive_message(std::string*) override { return rpctrace::Error{}; }
  rpctrace::Error close() override {
    closed = true;
    return rpctrace::Error{};
  }
};
