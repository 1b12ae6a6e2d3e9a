#include "core.hpp"
#include <boost/asio.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace ichain {

std::string make_random_uid() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

std::string hostname() {
  return boost::asio::ip::host_name();
}

std::string server_id() {
  return fmt::format("{}/{}", hostname(), make_random_uid());
}

pb::Timestamp current_time() {
  const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  auto nanos = (boost::posix_time::microsec_clock::universal_time() - epoch).total_nanoseconds();
  pb::Timestamp timestamp;
  timestamp.set_seconds(nanos / 1000000000);
  timestamp.set_nanos(nanos % 1000000000);
  return timestamp;
}

Status make_status(StatusCode code, std::string const& why, std::string const& id) {
  Status status;
  status.set_code(code);
  status.set_why(why);
  status.set_interceptor_id(id);
  return status;
}

std::string to_json(pb::Message const& message) {
  pb::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  std::string json;
  pb::MessageToJsonString(message, &json, options);
  return json;
}

boost::optional<pb::Value> parse_value(std::string const& json) {
  return from_json<pb::Value>(json);
}

}  // namespace ichain
