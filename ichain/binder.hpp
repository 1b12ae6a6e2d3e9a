#pragma once

#include "context.hpp"
#include "interceptor.hpp"

namespace ichain {

// Resolves the call arguments of one interceptor invocation. Every argument is taken from the
// first source that can satisfy it:
//   1. well-known context values matched by type: CancellationToken, ServerHandle,
//      ProgressEmitter, Context, std::shared_ptr<ServiceResolver> and the
//      InvokeInterceptorRequest itself;
//   2. the service resolver, for service parameters or types the resolver can_resolve();
//   3. the payload field named like the parameter.
// The request is never modified.
class ParameterBinder {
 public:
  Interceptor::Arguments bind(Interceptor const& interceptor,
                              msgs::InvokeInterceptorRequest const& request,
                              Context const& context) const;

 private:
  boost::optional<boost::any> well_known(Parameter const& parameter,
                                         msgs::InvokeInterceptorRequest const& request,
                                         Context const& context) const;

  boost::any from_services(std::string const& id, Parameter const& parameter,
                           Context const& context) const;

  boost::any from_payload(std::string const& id, Parameter const& parameter,
                          msgs::InvokeInterceptorRequest const& request) const;
};

}  // namespace ichain
