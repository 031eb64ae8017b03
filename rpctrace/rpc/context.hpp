#pragma once

#include <opentracing/span.h>
#include <boost/optional.hpp>
#include <memory>
#include "../core.hpp"

namespace rpctrace {

// Execution context of a single call. Contexts are immutable values: the with_* functions return
// modified copies, so a context can be handed to downstream code without being altered by it.
class Context {
  boost::optional<SystemTime> dl;
  std::shared_ptr<opentracing::Span> active_span;

 public:
  Context() = default;

  // Contexts share ownership of their span, but finishing it stays the job of whoever started it
  Context with_span(std::shared_ptr<opentracing::Span> const& span) const {
    Context ctx(*this);
    ctx.active_span = span;
    return ctx;
  }

  Context with_deadline(SystemTime deadline) const {
    Context ctx(*this);
    ctx.dl = deadline;
    return ctx;
  }

  opentracing::Span* span() const { return active_span.get(); }
  boost::optional<SystemTime> const& deadline() const { return dl; }

  bool deadline_exceeded() const { return dl && current_time() >= *dl; }
};

}  // namespace rpctrace
