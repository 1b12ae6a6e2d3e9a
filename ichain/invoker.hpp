#pragma once

#include <memory>
#include <vector>
#include "binder.hpp"
#include "hook.hpp"

namespace ichain {

// Invokes exactly one interceptor: binds its arguments, activates its per-call target, calls it
// and normalizes whatever it returned into an InvokeInterceptorResult.
class Invoker {
  ParameterBinder binder;
  std::vector<std::shared_ptr<ExecutionHook>> hooks;

 public:
  // Setup a hook to be called around every invocation. Not thread safe, add hooks before the
  // first call.
  template <typename T, typename... Args>
  void add_hook(Args&&... args) {
    hooks.push_back(std::make_shared<T>(std::forward<Args>(args)...));
  }
  void add_hook(std::shared_ptr<ExecutionHook> const& hook) { hooks.push_back(hook); }

  // Failures propagate as ichain::Error attributed to the interceptor, HANDLER_FAILURE for
  // exceptions raised by the interceptor itself.
  msgs::InvokeInterceptorResult invoke(Interceptor const& interceptor,
                                       msgs::InvokeInterceptorRequest const& request,
                                       Context const& context) const;

 private:
  msgs::InvokeInterceptorResult call(Interceptor const& interceptor,
                                     msgs::InvokeInterceptorRequest const& request,
                                     Context const& context) const;
};

// Maps a tagged return value to a result according to the interceptor type. Payloads only count
// for mutation interceptors.
msgs::InvokeInterceptorResult normalize(InterceptorType type, Returned const& returned);

}  // namespace ichain
