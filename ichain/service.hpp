#pragma once

#include "engine.hpp"

namespace ichain {

// Protocol operations of an interceptor server. Every operation reports its outcome as a Status,
// exceptions never escape. When a chain fails in its mutation group the reply still carries the
// partial result next to the failure status.
class InterceptorService {
  Engine& engine;

 public:
  explicit InterceptorService(Engine& engine) : engine(engine) {}

  Status invoke(msgs::InvokeInterceptorRequest const& request, msgs::InvokeInterceptorResult* reply,
                Context const& context = Context()) const;

  Status execute_chain(msgs::ExecuteChainRequest const& request, msgs::ExecuteChainResult* reply,
                       Context const& context = Context()) const;

  Status list(msgs::ListInterceptorsRequest const& request,
              msgs::ListInterceptorsResult* reply) const;

  msgs::InterceptorsCapability capabilities() const;
};

}  // namespace ichain
