#pragma once

#include <functional>
#include <memory>
#include "../errors.hpp"
#include "../rpc/context.hpp"
#include "request.hpp"
#include "response.hpp"
#include "stream.hpp"

namespace rpctrace {
namespace transport {

// Outbounds send requests to remote services. Every outbound must be safe for concurrent use.

class UnaryOutbound {
 public:
  virtual ~UnaryOutbound() {}
  // On success the response is filled in; it is left untouched when there is none.
  virtual Error call(Context const& ctx, Request const& request, Response* response) = 0;
};

class OnewayOutbound {
 public:
  virtual ~OnewayOutbound() {}
  virtual Error call_oneway(Context const& ctx, Request const& request, Ack* ack) = 0;
};

class StreamOutbound {
 public:
  virtual ~StreamOutbound() {}
  virtual Error call_stream(Context const& ctx, StreamRequest const& request,
                            std::unique_ptr<ClientStream>* stream) = 0;
};

// A unary outbound that sends nothing, producing neither a response nor an error
class NopUnaryOutbound : public UnaryOutbound {
 public:
  Error call(Context const& ctx, Request const& request, Response* response) override;
};

// Adapts a function into a UnaryOutbound
class UnaryOutboundFunc : public UnaryOutbound {
 public:
  using Function = std::function<Error(Context const&, Request const&, Response*)>;

  explicit UnaryOutboundFunc(Function f) : func(std::move(f)) {}
  Error call(Context const& ctx, Request const& request, Response* response) override;

 private:
  Function func;
};

// Adapts a function into a OnewayOutbound
class OnewayOutboundFunc : public OnewayOutbound {
 public:
  using Function = std::function<Error(Context const&, Request const&, Ack*)>;

  explicit OnewayOutboundFunc(Function f) : func(std::move(f)) {}
  Error call_oneway(Context const& ctx, Request const& request, Ack* ack) override;

 private:
  Function func;
};

// Adapts a function into a StreamOutbound
class StreamOutboundFunc : public StreamOutbound {
 public:
  using Function =
      std::function<Error(Context const&, StreamRequest const&, std::unique_ptr<ClientStream>*)>;

  explicit StreamOutboundFunc(Function f) : func(std::move(f)) {}
  Error call_stream(Context const& ctx, StreamRequest const& request,
                    std::unique_ptr<ClientStream>* stream) override;

 private:
  Function func;
};

}  // namespace transport
}  // namespace rpctrace
