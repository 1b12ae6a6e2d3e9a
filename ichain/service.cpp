#include "service.hpp"

namespace ichain {

namespace {

boost::optional<Status> check_target(std::string const& event, InterceptorPhase phase) {
  if (event.empty()) return make_status(StatusCode::INVALID_ARGUMENT, "Field 'event' is required");
  if (phase == InterceptorPhase::PHASE_UNSPECIFIED) {
    return make_status(StatusCode::INVALID_ARGUMENT, "Field 'phase' must be REQUEST or RESPONSE");
  }
  return boost::none;
}

template <typename Call>
Status guarded(std::string const& operation, Call&& call) {
  try {
    call();
  } catch (Error const& e) {
    warn("{} failed with {}: {}", operation, msgs::StatusCode_Name(e.code()), e.what());
    return e.status();
  } catch (std::exception const& e) {
    auto reason = fmt::format("{} failed with exception: '{}'", operation, e.what());
    error(reason);
    return make_status(StatusCode::INTERNAL_ERROR, reason);
  }
  return make_status(StatusCode::OK);
}

}  // namespace

Status InterceptorService::invoke(msgs::InvokeInterceptorRequest const& request,
                                  msgs::InvokeInterceptorResult* reply,
                                  Context const& context) const {
  if (request.interceptor_id().empty()) {
    return make_status(StatusCode::INVALID_ARGUMENT, "Field 'interceptor_id' is required");
  }
  if (auto invalid = check_target(request.event(), request.phase())) return *invalid;

  return guarded("Invoke", [&] { *reply = engine.invoke(request, context); });
}

Status InterceptorService::execute_chain(msgs::ExecuteChainRequest const& request,
                                         msgs::ExecuteChainResult* reply,
                                         Context const& context) const {
  if (auto invalid = check_target(request.event(), request.phase())) return *invalid;

  try {
    *reply = engine.execute_chain(request, context);
  } catch (ChainError const& e) {
    warn("ExecuteChain failed with {}: {}", msgs::StatusCode_Name(e.code()), e.what());
    *reply = e.partial();
    return e.status();
  } catch (Error const& e) {
    warn("ExecuteChain failed with {}: {}", msgs::StatusCode_Name(e.code()), e.what());
    return e.status();
  } catch (std::exception const& e) {
    auto reason = fmt::format("ExecuteChain failed with exception: '{}'", e.what());
    error(reason);
    return make_status(StatusCode::INTERNAL_ERROR, reason);
  }
  return make_status(StatusCode::OK);
}

Status InterceptorService::list(msgs::ListInterceptorsRequest const& request,
                                msgs::ListInterceptorsResult* reply) const {
  return guarded("List", [&] { *reply = engine.list(request); });
}

msgs::InterceptorsCapability InterceptorService::capabilities() const {
  msgs::InterceptorsCapability capability;
  capability.set_list_changed(true);
  return capability;
}

}  // namespace ichain
