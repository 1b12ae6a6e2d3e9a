#include "interceptor-server.hpp"

namespace ichain {
namespace rpc {

void Notifier::notify(std::string const& topic, pb::Message const& message) {
  std::lock_guard<std::mutex> lock(mutex);
  publish(channel, topic, pack_json(message));
}

InterceptorServer::InterceptorServer(Engine& e, std::string const& uri, std::string const& name)
    : engine(e), service(e), notifier(std::make_shared<Notifier>(uri)) {
  provider.connect(uri);
  queue = provider.declare_queue(name);

  provider.delegate<msgs::InvokeInterceptorRequest, msgs::InvokeInterceptorResult>(
      queue, "Invoke", [this](auto const& request, auto* reply, RpcContext* rpc) {
        auto meta_request = request;
        if (!rpc->progress_token().empty()) {
          meta_request.mutable_meta()->set_progress_token(rpc->progress_token());
        }
        return service.invoke(meta_request, reply, make_context(rpc));
      });

  provider.delegate<msgs::ExecuteChainRequest, msgs::ExecuteChainResult>(
      queue, "ExecuteChain", [this](auto const& request, auto* reply, RpcContext* rpc) {
        auto meta_request = request;
        if (!rpc->progress_token().empty()) {
          meta_request.mutable_meta()->set_progress_token(rpc->progress_token());
        }
        return service.execute_chain(meta_request, reply, make_context(rpc));
      });

  provider.delegate<msgs::ListInterceptorsRequest, msgs::ListInterceptorsResult>(
      queue, "List", [this](auto const& request, auto* reply, RpcContext*) {
        return service.list(request, reply);
      });

  auto changed_topic = fmt::format("{}.ListChanged", queue);
  std::weak_ptr<Notifier> weak_notifier = notifier;
  engine.get_registry().on_change([weak_notifier, changed_topic] {
    if (auto notifier = weak_notifier.lock()) {
      notifier->notify(changed_topic, msgs::InterceptorListChanged());
    }
  });
}

void InterceptorServer::run(std::function<bool()> const& keep_running) const {
  info("Serving interceptors on '{}'", queue);
  provider.run(keep_running);
}

Context InterceptorServer::make_context(RpcContext* rpc) const {
  Context context(rpc->id());
  context.with_server({provider.get_tag(), rpc->reply_topic()}).with_services(services);

  if (rpc->expects_reply() && !rpc->progress_token().empty()) {
    auto progress_topic = fmt::format("{}.Progress", rpc->reply_topic());
    std::weak_ptr<Notifier> weak_notifier = notifier;
    context.with_progress([weak_notifier, progress_topic](msgs::ProgressNotification const& n) {
      if (auto notifier = weak_notifier.lock()) notifier->notify(progress_topic, n);
    });
  }
  return context;
}

}  // namespace rpc
}  // namespace ichain
