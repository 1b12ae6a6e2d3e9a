#pragma once

#include <mutex>
#include "../service.hpp"
#include "service-provider.hpp"

namespace ichain {
namespace rpc {

// Publishes notifications from any thread on a channel of its own, the channel serving requests
// is only ever touched by the thread running the provider.
class Notifier {
  rmq::Channel::ptr_t channel;
  std::mutex mutex;

 public:
  explicit Notifier(std::string const& uri) : channel(make_channel(uri)) {}

  void notify(std::string const& topic, pb::Message const& message);
};

// Exposes an engine on the broker:
//   <name>.Invoke        InvokeInterceptorRequest -> InvokeInterceptorResult
//   <name>.ExecuteChain  ExecuteChainRequest      -> ExecuteChainResult
//   <name>.List          ListInterceptorsRequest  -> ListInterceptorsResult
// Progress is published to '<reply-to>.Progress' when the request carries a 'progress-token'
// header, changes to the registry are announced on '<name>.ListChanged'.
class InterceptorServer {
  Engine& engine;
  InterceptorService service;
  ServiceProvider provider;
  std::shared_ptr<Notifier> notifier;
  std::shared_ptr<ServiceResolver> services;
  std::string queue;

 public:
  InterceptorServer(Engine& engine, std::string const& uri,
                    std::string const& name = "Interceptors");

  std::string const& get_queue() const { return queue; }

  // Services handed to interceptors of every call served from now on
  void set_services(std::shared_ptr<ServiceResolver> const& resolver) { services = resolver; }

  void run(std::function<bool()> const& keep_running) const;

 private:
  Context make_context(RpcContext* rpc) const;
};

}  // namespace rpc
}  // namespace ichain
