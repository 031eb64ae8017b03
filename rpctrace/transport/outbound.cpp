#include "outbound.hpp"

namespace rpctrace {
namespace transport {

Error NopUnaryOutbound::call(Context const&, Request const&, Response*) {
  return Error{};
}

Error UnaryOutboundFunc::call(Context const& ctx, Request const& request, Response* response) {
  return func(ctx, request, response);
}

Error OnewayOutboundFunc::call_oneway(Context const& ctx, Request const& request, Ack* ack) {
  return func(ctx, request, ack);
}

Error StreamOutboundFunc::call_stream(Context const& ctx, StreamRequest const& request,
                                      std::unique_ptr<ClientStream>* stream) {
  return func(ctx, request, stream);
}

}  // namespace transport
}  // namespace rpctrace
