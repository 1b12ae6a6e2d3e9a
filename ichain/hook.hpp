#pragma once

#include <google/protobuf/timestamp.pb.h>
#include "context.hpp"
#include "descriptor.hpp"
#include "errors.hpp"

namespace ichain {

// What a hook gets to see about a single interceptor invocation.
struct InvocationContext {
  Descriptor const* descriptor;
  std::string event;
  InterceptorPhase phase;
  Context const* call;
  google::protobuf::Timestamp started_at;
  // Filled before after_invoke is called
  Status status;
};

// A hook presents a way of customizing the behaviour of the invoker, allowing functions to be
// called before or/and after every interceptor. Hooks are shared by concurrent invocations and
// must keep per-call state in the InvocationContext.
struct ExecutionHook {
  virtual ~ExecutionHook() {}

  // Function that will be called right before the interceptor
  virtual void before_invoke(InvocationContext* context) = 0;

  // Function that will be called right after the interceptor, even if it failed
  virtual void after_invoke(InvocationContext* context) = 0;
};

}  // namespace ichain
