#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <ichain/msgs/interceptor.pb.h>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <string>
#include "logger.hpp"

namespace ichain {

namespace po = boost::program_options;
namespace pb {
using namespace google::protobuf::util;
using namespace google::protobuf;
}  // namespace pb

using msgs::Status;
using msgs::StatusCode;

// Returns a unique id
std::string make_random_uid();

// Returns the machine hostname
std::string hostname();

// Identifies this server process. The hostname is used because normally container orchestration
// tools set the container hostname to be its id. The uid part is added to avoid name collisions
// when running outside a container.
std::string server_id();

// Return the timestamp that represents the current time with nanosecond precision in relation
// to the 1970/1/1 epoch.
pb::Timestamp current_time();

Status make_status(StatusCode code, std::string const& why = "", std::string const& id = "");

/* ======
    JSON
   ====== */

// Serializes a message using the protobuf JSON mapping, enums are written as strings.
std::string to_json(pb::Message const& message);

// Parses a JSON document into an arbitrary structured value.
boost::optional<pb::Value> parse_value(std::string const& json);

template <typename T>
boost::optional<T> from_json(std::string const& json);

/* =========
    File IO
   ========= */

template <typename T>
boost::optional<T> load_from_json(std::string const& filename);

}  // namespace ichain

// ===== Template Imlementations ==========
namespace ichain {

template <typename T>
boost::optional<T> from_json(std::string const& json) {
  T object;
  if (!pb::JsonStringToMessage(json, &object).ok()) return boost::none;
  return object;
}

template <typename T>
boost::optional<T> load_from_json(std::string const& filename) {
  std::ifstream in(filename);
  if (!in) return boost::none;
  std::string buffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return from_json<T>(buffer);
}

}  // namespace ichain
