#include "service-provider.hpp"

namespace ichain {
namespace rpc {

void RpcContext::set_reply(rmq::BasicMessage::ptr_t const& reply, Status const& status) {
  rep = reply;
  stat = status;
  if (req->Message()->CorrelationIdIsSet()) rep->CorrelationId(id());
  std::string packed_status;
  pb::MessageToJsonString(status, &packed_status);
  add_header(rep, "rpc-status", packed_status);
}

std::string ServiceProvider::declare_queue(std::string name, std::string const& id,
                                           int queue_size) const {
  auto exclusive = !id.empty();
  if (exclusive) name += '.' + id;
  channel->DeclareExchange(kExchange, "topic");
  rmq::Table headers{{rmq::TableKey("x-max-length"), rmq::TableValue(queue_size)}};
  channel->DeclareQueue(name, /*passive*/ false, /*durable*/ false, exclusive,
                        /*autodelete*/ true, headers);
  channel->BasicConsume(name, tag, /*nolocal*/ true, /*noack*/ false, exclusive);
  return name;
}

void ServiceProvider::serve(rmq::Envelope::ptr_t const& envelope) const {
  auto method = methods.find(envelope->RoutingKey());
  if (method != methods.end()) {
    RpcContext context(envelope);
    method->second(&context);
    debug("{};{}", context.topic(), msgs::StatusCode_Name(context.status().code()));
    if (context.expects_reply()) publish(channel, context.reply_topic(), context.reply());
  } else {
    warn("No method bound to '{}'", envelope->RoutingKey());
  }

  channel->BasicAck(envelope);
}

void ServiceProvider::run(std::function<bool()> const& keep_running, int poll_ms) const {
  while (keep_running()) {
    rmq::Envelope::ptr_t envelope;
    if (channel->BasicConsumeMessage(tag, envelope, poll_ms)) serve(envelope);
  }
}

}  // namespace rpc
}  // namespace ichain
