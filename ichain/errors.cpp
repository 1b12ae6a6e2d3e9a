#include "errors.hpp"
#include "core.hpp"

namespace ichain {

Error::Error(StatusCode code, std::string const& what, std::string const& interceptor_id)
    : std::runtime_error(what), error_code(code), id(interceptor_id) {}

Status Error::status() const {
  return make_status(error_code, what(), id);
}

ChainError::ChainError(Error const& cause, msgs::ExecuteChainResult partial)
    : Error(cause.code(),
            fmt::format("Chain aborted at mutation interceptor '{}': {}", cause.interceptor_id(),
                        cause.what()),
            cause.interceptor_id()),
      partial_result(std::move(partial)) {}

Error duplicate_id(std::string const& id) {
  return Error(StatusCode::DUPLICATE_ID,
               fmt::format("An interceptor with id '{}' is already registered", id), id);
}

Error unknown_interceptor_id(std::string const& id) {
  return Error(StatusCode::UNKNOWN_INTERCEPTOR_ID,
               fmt::format("No interceptor registered with id '{}'", id), id);
}

Error missing_required_parameter(std::string const& id, std::string const& parameter) {
  return Error(StatusCode::MISSING_REQUIRED_PARAMETER,
               fmt::format("Interceptor '{}' requires parameter '{}' but none was provided", id,
                           parameter),
               id);
}

Error handler_failure(std::string const& id, std::exception const& e) {
  if (auto engine_error = dynamic_cast<Error const*>(&e)) {
    if (engine_error->interceptor_id() == id) return *engine_error;
    return Error(engine_error->code(), engine_error->what(), id);
  }
  return Error(StatusCode::HANDLER_FAILURE,
               fmt::format("Interceptor '{}' failed with exception: '{}'", id, e.what()), id);
}

Error handler_failure(std::string const& id) {
  return Error(StatusCode::HANDLER_FAILURE,
               fmt::format("Interceptor '{}' failed with an unknown exception", id), id);
}

}  // namespace ichain
