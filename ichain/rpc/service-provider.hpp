#pragma once

#include <functional>
#include <unordered_map>
#include "../errors.hpp"
#include "amqp.hpp"

namespace ichain {
namespace rpc {

// State of a single AMQP request while it is being served.
class RpcContext {
  rmq::Envelope::ptr_t req;
  rmq::BasicMessage::ptr_t rep;
  Status stat;

 public:
  RpcContext(rmq::Envelope::ptr_t const& request) : req(request) {}

  rmq::Envelope::ptr_t request() const { return req; }
  rmq::BasicMessage::ptr_t reply() const { return rep; }
  Status status() const { return stat; }

  std::string id() const {
    return req->Message()->CorrelationIdIsSet() ? req->Message()->CorrelationId() : "";
  }
  std::string topic() const { return req->RoutingKey(); }
  bool expects_reply() const { return req->Message()->ReplyToIsSet(); }
  std::string reply_topic() const {
    return expects_reply() ? req->Message()->ReplyTo() : fmt::format("{}.Reply", topic());
  }
  // Clients ask for progress notifications by sending a token in this header
  std::string progress_token() const { return header(req, "progress-token"); }

  void set_reply(rmq::BasicMessage::ptr_t const& reply, Status const& status);
};

// Serves protobuf/JSON request-reply methods bound to a queue of the broker.
class ServiceProvider {
  using MethodHandler = std::function<void(RpcContext*)>;

  rmq::Channel::ptr_t channel;
  std::unordered_map<std::string, MethodHandler> methods;
  std::string tag;

 public:
  ServiceProvider() : tag(server_id()) {}
  void connect(std::string const& uri) { channel = make_channel(uri); }

  std::string const& get_tag() const { return tag; }

  std::string declare_queue(std::string name, std::string const& id = "",
                            int queue_size = 64) const;

  // Bind a function to a particular topic, so everytime a message is received in this topic the
  // function will be called. The reply is sent whatever the status is, methods may fill it
  // partially when they fail.
  template <typename Request, typename Reply>
  void delegate(std::string const& queue, std::string const& name,
                std::function<Status(Request const&, Reply*, RpcContext*)> method);

  void serve(rmq::Envelope::ptr_t const& envelope) const;

  // Blocks the current thread listening for requests until keep_running returns false. It is
  // checked at least every poll_ms.
  void run(std::function<bool()> const& keep_running, int poll_ms = 200) const;
};

}  // namespace rpc
}  // namespace ichain

// ===== Template Imlementations ==========
namespace ichain {
namespace rpc {

template <typename Request, typename Reply>
void ServiceProvider::delegate(std::string const& queue, std::string const& name,
                               std::function<Status(Request const&, Reply*, RpcContext*)> method) {
  std::string binding = fmt::format("{}.{}", queue, name);
  channel->BindQueue(queue, kExchange, binding);

  methods.emplace(binding, [=](RpcContext* context) {
    boost::optional<Request> request = unpack<Request>(context->request());
    Reply reply;
    Status status;

    if (request) {
      try {
        status = method(*request, &reply, context);
      } catch (std::exception const& e) {
        auto reason = fmt::format("Call to {} failed with exception\n: '{}'", binding, e.what());
        status = make_status(StatusCode::INTERNAL_ERROR, reason);
      }
    } else {
      auto reason = fmt::format("Expected type '{}' but received something else",
                                Request::descriptor()->full_name());
      status = make_status(StatusCode::SERIALIZATION_ERROR, reason);
    }

    context->set_reply(is_protobuf(context->request()) ? pack_proto(reply) : pack_json(reply),
                       status);
  });
}

}  // namespace rpc
}  // namespace ichain
