#pragma once

#include <functional>
#include "../errors.hpp"
#include "../rpc/context.hpp"
#include "request.hpp"
#include "response.hpp"
#include "stream.hpp"

namespace rpctrace {
namespace transport {

// Handlers are implemented by the application and invoked by inbound transports. Every handler
// must be safe for concurrent use.

class UnaryHandler {
 public:
  virtual ~UnaryHandler() {}
  virtual Error handle(Context const& ctx, Request const& request, ResponseWriter& writer) = 0;
};

class OnewayHandler {
 public:
  virtual ~OnewayHandler() {}
  virtual Error handle_oneway(Context const& ctx, Request const& request) = 0;
};

class StreamHandler {
 public:
  virtual ~StreamHandler() {}
  virtual Error handle_stream(ServerStream& stream) = 0;
};

// Adapts a function into a UnaryHandler
class UnaryHandlerFunc : public UnaryHandler {
 public:
  using Function = std::function<Error(Context const&, Request const&, ResponseWriter&)>;

  explicit UnaryHandlerFunc(Function f) : func(std::move(f)) {}
  Error handle(Context const& ctx, Request const& request, ResponseWriter& writer) override {
    return func(ctx, request, writer);
  }

 private:
  Function func;
};

// Adapts a function into a OnewayHandler
class OnewayHandlerFunc : public OnewayHandler {
 public:
  using Function = std::function<Error(Context const&, Request const&)>;

  explicit OnewayHandlerFunc(Function f) : func(std::move(f)) {}
  Error handle_oneway(Context const& ctx, Request const& request) override {
    return func(ctx, request);
  }

 private:
  Function func;
};

// Adapts a function into a StreamHandler
class StreamHandlerFunc : public StreamHandler {
 public:
  using Function = std::function<Error(ServerStream&)>;

  explicit StreamHandlerFunc(Function f) : func(std::move(f)) {}
  Error handle_stream(ServerStream& stream) override { return func(stream); }

 private:
  Function func;
};

}  // namespace transport
}  // namespace rpctrace
