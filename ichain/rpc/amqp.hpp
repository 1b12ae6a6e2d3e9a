#pragma once

#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <boost/optional.hpp>
#include "../core.hpp"

namespace ichain {
namespace rpc {

namespace rmq = AmqpClient;

// Exchange every interceptor server binds its queues to
const std::string kExchange = "ichain";

// Add key value pair to the message header
template <typename T>
void add_header(rmq::BasicMessage::ptr_t const& message, std::string const& key, T const& value);

// Header value as a string, empty if the header is missing
std::string header(rmq::Envelope::ptr_t const& envelope, std::string const& key);

/* =================================
   Serialization / Deserialization
   ================================= */

// Check if the envelope contains a protobuf payload
bool is_protobuf(rmq::Envelope::ptr_t const& envelope);

// Check if the envelope contains a json payload
bool is_json(rmq::Envelope::ptr_t const& envelope);

// Tries to deserialize the contents of an envelope based on the content-type specified. If no
// content-type is provided the implementation will try to deserialize it using all the supported
// types (First JSON then Protobuf).
template <typename T>
boost::optional<T> unpack(rmq::Envelope::ptr_t const& envelope);

// Serializes the message to the protobuf binary protocol and uses it as the AMQP body.
rmq::BasicMessage::ptr_t pack_proto(pb::Message const& object);

// Same as pack_proto but using the protobuf JSON mapping.
rmq::BasicMessage::ptr_t pack_json(pb::Message const& object);

/* ===========
    Transport
   ============ */

rmq::Channel::ptr_t make_channel(std::string const& uri);

void publish(rmq::Channel::ptr_t const& channel, std::string const& topic,
             rmq::BasicMessage::ptr_t const& message);

}  // namespace rpc
}  // namespace ichain

// ===== Template Imlementations ==========
namespace ichain {
namespace rpc {

template <typename T>
void add_header(rmq::BasicMessage::ptr_t const& message, std::string const& key, T const& value) {
  auto table = message->HeaderTableIsSet() ? message->HeaderTable() : rmq::Table();
  table.emplace(rmq::TableKey(key), rmq::TableValue(value));
  message->HeaderTable(table);
}

template <typename T>
boost::optional<T> unpack(rmq::Envelope::ptr_t const& envelope) {
  auto const& body = envelope->Message()->Body();
  if (is_protobuf(envelope)) {
    T object;
    if (!object.ParseFromString(body)) return boost::none;
    return object;
  }
  if (is_json(envelope)) return from_json<T>(body);
  // User didn't provide a valid type, try all.
  auto unpacked = from_json<T>(body);
  if (unpacked) {
    envelope->Message()->ContentType("application/json");
    return unpacked;
  }
  T object;
  if (!object.ParseFromString(body)) return boost::none;
  envelope->Message()->ContentType("application/x-protobuf");
  return object;
}

}  // namespace rpc
}  // namespace ichain
