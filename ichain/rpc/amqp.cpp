#include "amqp.hpp"

namespace ichain {
namespace rpc {

std::string header(rmq::Envelope::ptr_t const& envelope, std::string const& key) {
  if (!envelope->Message()->HeaderTableIsSet()) return "";
  auto table = envelope->Message()->HeaderTable();
  auto found = table.find(rmq::TableKey(key));
  if (found == table.end() || found->second.GetType() != rmq::TableValue::VT_string) return "";
  return found->second.GetString();
}

bool is_protobuf(rmq::Envelope::ptr_t const& envelope) {
  return envelope->Message()->ContentTypeIsSet() &&
         envelope->Message()->ContentType() == "application/x-protobuf";
}

bool is_json(rmq::Envelope::ptr_t const& envelope) {
  return envelope->Message()->ContentTypeIsSet() &&
         envelope->Message()->ContentType() == "application/json";
}

rmq::BasicMessage::ptr_t pack_proto(pb::Message const& object) {
  std::string packed;
  object.SerializeToString(&packed);
  auto message = rmq::BasicMessage::Create(packed);
  message->ContentType("application/x-protobuf");
  return message;
}

rmq::BasicMessage::ptr_t pack_json(pb::Message const& object) {
  auto message = rmq::BasicMessage::Create(to_json(object));
  message->ContentType("application/json");
  return message;
}

rmq::Channel::ptr_t make_channel(std::string const& uri) {
  return rmq::Channel::CreateFromUri(uri);
}

void publish(rmq::Channel::ptr_t const& channel, std::string const& topic,
             rmq::BasicMessage::ptr_t const& message) {
  if (!message->TimestampIsSet()) {
    message->Timestamp(pb::TimeUtil::TimestampToMilliseconds(current_time()));
  }
  channel->BasicPublish(kExchange, topic, message);
}

}  // namespace rpc
}  // namespace ichain
