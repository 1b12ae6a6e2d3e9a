#include "invoker.hpp"

namespace ichain {

namespace {

// Owns the per-call target object, if the interceptor has one, and disposes it when the call
// leaves the scope: asynchronous disposal is awaited first, then the object is destroyed.
class TargetScope {
  Target target;
  std::string id;

 public:
  TargetScope(Interceptor const& interceptor, msgs::InvokeInterceptorRequest const& request)
      : id(interceptor.id()) {
    if (interceptor.has_target()) target = interceptor.activate(request);
  }

  TargetScope(TargetScope const&) = delete;
  TargetScope& operator=(TargetScope const&) = delete;

  ~TargetScope() {
    if (target.dispose_async) {
      try {
        target.dispose_async().get();
      } catch (std::exception const& e) {
        warn("Failed to dispose target of interceptor '{}': {}", id, e.what());
      } catch (...) {
        warn("Failed to dispose target of interceptor '{}': unknown exception", id);
      }
    }
  }

  void* get() const { return target.object.get(); }
};

class Normalizer : public boost::static_visitor<msgs::InvokeInterceptorResult> {
  InterceptorType type;

 public:
  explicit Normalizer(InterceptorType t) : type(t) {}

  msgs::InvokeInterceptorResult operator()(boost::blank) const { return {}; }

  msgs::InvokeInterceptorResult operator()(pb::Value const& payload) const {
    msgs::InvokeInterceptorResult result;
    if (type == InterceptorType::MUTATION) *result.mutable_modified_payload() = payload;
    return result;
  }

  msgs::InvokeInterceptorResult operator()(Findings const& findings) const {
    msgs::InvokeInterceptorResult result;
    for (auto&& finding : findings) {
      *result.add_validation_results() = finding;
    }
    return result;
  }

  msgs::InvokeInterceptorResult operator()(msgs::InvokeInterceptorResult const& returned) const {
    auto result = returned;
    if (type != InterceptorType::MUTATION && result.has_modified_payload()) {
      debug("Dropping payload returned by a {} interceptor", msgs::InterceptorType_Name(type));
      result.clear_modified_payload();
    }
    return result;
  }
};

template <typename Member>
void run_hooks(std::vector<std::shared_ptr<ExecutionHook>> const& hooks, Member member,
               InvocationContext* context) {
  for (auto&& hook : hooks) {
    try {
      ((*hook).*member)(context);
    } catch (std::exception const& e) {
      warn("Execution hook failed for '{}': {}", context->descriptor->id(), e.what());
    } catch (...) {
      warn("Execution hook failed for '{}': unknown exception", context->descriptor->id());
    }
  }
}

}  // namespace

msgs::InvokeInterceptorResult normalize(InterceptorType type, Returned const& returned) {
  return boost::apply_visitor(Normalizer(type), returned);
}

msgs::InvokeInterceptorResult Invoker::invoke(Interceptor const& interceptor,
                                              msgs::InvokeInterceptorRequest const& request,
                                              Context const& context) const {
  InvocationContext invocation;
  invocation.descriptor = &interceptor.descriptor();
  invocation.event = request.event();
  invocation.phase = request.phase();
  invocation.call = &context;
  invocation.started_at = current_time();
  run_hooks(hooks, &ExecutionHook::before_invoke, &invocation);

  msgs::InvokeInterceptorResult result;
  boost::optional<Error> failure;
  try {
    result = call(interceptor, request, context);
  } catch (std::exception const& e) {
    failure = handler_failure(interceptor.id(), e);
  } catch (...) {
    failure = handler_failure(interceptor.id());
  }

  if (failure) {
    invocation.status = failure->status();
    run_hooks(hooks, &ExecutionHook::after_invoke, &invocation);
    throw *failure;
  }

  invocation.status = make_status(StatusCode::OK);
  run_hooks(hooks, &ExecutionHook::after_invoke, &invocation);
  return result;
}

msgs::InvokeInterceptorResult Invoker::call(Interceptor const& interceptor,
                                            msgs::InvokeInterceptorRequest const& request,
                                            Context const& context) const {
  auto arguments = binder.bind(interceptor, request, context);
  TargetScope target(interceptor, request);
  return normalize(interceptor.type(), interceptor.call(arguments, target.get()));
}

}  // namespace ichain
