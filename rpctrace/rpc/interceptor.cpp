#include "interceptor.hpp"

namespace rpctrace {

namespace {

class InterceptedUnaryHandler : public transport::UnaryHandler {
  UnaryInbound& interceptor;
  transport::UnaryHandler& next;

 public:
  InterceptedUnaryHandler(UnaryInbound& i, transport::UnaryHandler& h) : interceptor(i), next(h) {}

  Error handle(Context const& ctx, transport::Request const& request,
               transport::ResponseWriter& writer) override {
    return interceptor.handle(ctx, request, writer, next);
  }
};

class InterceptedOnewayHandler : public transport::OnewayHandler {
  OnewayInbound& interceptor;
  transport::OnewayHandler& next;

 public:
  InterceptedOnewayHandler(OnewayInbound& i, transport::OnewayHandler& h)
      : interceptor(i), next(h) {}

  Error handle_oneway(Context const& ctx, transport::Request const& request) override {
    return interceptor.handle_oneway(ctx, request, next);
  }
};

class InterceptedStreamHandler : public transport::StreamHandler {
  StreamInbound& interceptor;
  transport::StreamHandler& next;

 public:
  InterceptedStreamHandler(StreamInbound& i, transport::StreamHandler& h)
      : interceptor(i), next(h) {}

  Error handle_stream(transport::ServerStream& stream) override {
    return interceptor.handle_stream(stream, next);
  }
};

class InterceptedUnaryOutbound : public transport::UnaryOutbound {
  rpctrace::UnaryOutbound& interceptor;
  transport::UnaryOutbound& next;

 public:
  InterceptedUnaryOutbound(rpctrace::UnaryOutbound& i, transport::UnaryOutbound& o)
      : interceptor(i), next(o) {}

  Error call(Context const& ctx, transport::Request const& request,
             transport::Response* response) override {
    return interceptor.call(ctx, request, response, next);
  }
};

class InterceptedOnewayOutbound : public transport::OnewayOutbound {
  rpctrace::OnewayOutbound& interceptor;
  transport::OnewayOutbound& next;

 public:
  InterceptedOnewayOutbound(rpctrace::OnewayOutbound& i, transport::OnewayOutbound& o)
      : interceptor(i), next(o) {}

  Error call_oneway(Context const& ctx, transport::Request const& request,
                    transport::Ack* ack) override {
    return interceptor.call_oneway(ctx, request, ack, next);
  }
};

class InterceptedStreamOutbound : public transport::StreamOutbound {
  rpctrace::StreamOutbound& interceptor;
  transport::StreamOutbound& next;

 public:
  InterceptedStreamOutbound(rpctrace::StreamOutbound& i, transport::StreamOutbound& o)
      : interceptor(i), next(o) {}

  Error call_stream(Context const& ctx, transport::StreamRequest const& request,
                    std::unique_ptr<transport::ClientStream>* stream) override {
    return interceptor.call_stream(ctx, request, stream, next);
  }
};

}  // namespace

std::unique_ptr<transport::UnaryHandler> apply(UnaryInbound& interceptor,
                                               transport::UnaryHandler& handler) {
  return std::unique_ptr<transport::UnaryHandler>(
      new InterceptedUnaryHandler(interceptor, handler));
}

std::unique_ptr<transport::OnewayHandler> apply(OnewayInbound& interceptor,
                                                transport::OnewayHandler& handler) {
  return std::unique_ptr<transport::OnewayHandler>(
      new InterceptedOnewayHandler(interceptor, handler));
}

std::unique_ptr<transport::StreamHandler> apply(StreamInbound& interceptor,
                                                transport::StreamHandler& handler) {
  return std::unique_ptr<transport::StreamHandler>(
      new InterceptedStreamHandler(interceptor, handler));
}

std::unique_ptr<transport::UnaryOutbound> apply(UnaryOutbound& interceptor,
                                                transport::UnaryOutbound& outbound) {
  return std::unique_ptr<transport::UnaryOutbound>(
      new InterceptedUnaryOutbound(interceptor, outbound));
}

std::unique_ptr<transport::OnewayOutbound> apply(OnewayOutbound& interceptor,
                                                 transport::OnewayOutbound& outbound) {
  return std::unique_ptr<transport::OnewayOutbound>(
      new InterceptedOnewayOutbound(interceptor, outbound));
}

std::unique_ptr<transport::StreamOutbound> apply(StreamOutbound& interceptor,
                                                 transport::StreamOutbound& outbound) {
  return std::unique_ptr<transport::StreamOutbound>(
      new InterceptedStreamOutbound(interceptor, outbound));
}

}  // namespace rpctrace
