#include "binder.hpp"

namespace ichain {

Interceptor::Arguments ParameterBinder::bind(Interceptor const& interceptor,
                                             msgs::InvokeInterceptorRequest const& request,
                                             Context const& context) const {
  Interceptor::Arguments arguments;
  arguments.reserve(interceptor.parameters().size());

  for (auto&& parameter : interceptor.parameters()) {
    auto value = well_known(parameter, request, context);
    if (value) {
      arguments.push_back(*value);
      continue;
    }

    auto const& services = context.services();
    auto resolvable = services && services->can_resolve(parameter.type);
    if (parameter.source != ParameterSource::Automatic || resolvable) {
      arguments.push_back(from_services(interceptor.id(), parameter, context));
    } else {
      arguments.push_back(from_payload(interceptor.id(), parameter, request));
    }
  }
  return arguments;
}

boost::optional<boost::any> ParameterBinder::well_known(
    Parameter const& parameter, msgs::InvokeInterceptorRequest const& request,
    Context const& context) const {
  auto const& type = parameter.type;
  if (type == typeid(CancellationToken)) return boost::any(context.token());
  if (type == typeid(ServerHandle)) return boost::any(context.server());
  if (type == typeid(Context)) return boost::any(context);
  if (type == typeid(std::shared_ptr<ServiceResolver>)) return boost::any(context.services());
  if (type == typeid(msgs::InvokeInterceptorRequest)) return boost::any(request);
  if (type == typeid(ProgressEmitter)) {
    return boost::any(context.progress(request.meta().progress_token()));
  }
  return boost::none;
}

boost::any ParameterBinder::from_services(std::string const& id, Parameter const& parameter,
                                          Context const& context) const {
  auto const& services = context.services();
  boost::optional<boost::any> service;
  if (services) {
    service = parameter.source == ParameterSource::KeyedService
                  ? services->resolve_keyed(parameter.type, parameter.key)
                  : services->resolve(parameter.type);
  }
  if (service) return *service;
  if (parameter.fallback) return parameter.fallback();

  auto what = parameter.source == ParameterSource::KeyedService
                  ? fmt::format("Interceptor '{}' requires service '{}' with key '{}' but none "
                                "was found",
                                id, parameter.name, parameter.key)
                  : fmt::format("Interceptor '{}' requires service '{}' but none was found", id,
                                parameter.name);
  throw Error(StatusCode::MISSING_REQUIRED_PARAMETER, what, id);
}

boost::any ParameterBinder::from_payload(std::string const& id, Parameter const& parameter,
                                         msgs::InvokeInterceptorRequest const& request) const {
  pb::Value const* field = nullptr;
  if (request.has_payload() && request.payload().has_struct_value()) {
    auto const& fields = request.payload().struct_value().fields();
    auto found = fields.find(parameter.name);
    if (found != fields.end()) field = &found->second;
  }

  if (field == nullptr) {
    if (parameter.fallback) return parameter.fallback();
    throw missing_required_parameter(id, parameter.name);
  }

  try {
    return parameter.convert(*field);
  } catch (ConversionError const& e) {
    throw Error(e.code(),
                fmt::format("Interceptor '{}' can't bind parameter '{}': {}", id, parameter.name,
                            e.what()),
                id);
  }
}

}  // namespace ichain
