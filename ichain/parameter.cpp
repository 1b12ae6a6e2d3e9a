#include "parameter.hpp"

namespace ichain {

Parameter arg(std::string const& name) {
  Parameter parameter;
  parameter.name = name;
  return parameter;
}

Parameter arg(std::string const& name, pb::Value const& default_value) {
  auto parameter = arg(name);
  parameter.default_value = default_value;
  return parameter;
}

Parameter service(std::string const& name) {
  auto parameter = arg(name);
  parameter.source = ParameterSource::Service;
  return parameter;
}

Parameter optional_service(std::string const& name) {
  auto parameter = service(name);
  parameter.optional = true;
  return parameter;
}

Parameter keyed_service(std::string const& name, std::string const& key) {
  auto parameter = arg(name);
  parameter.source = ParameterSource::KeyedService;
  parameter.key = key.empty() ? name : key;
  return parameter;
}

namespace detail {

std::string kind_name(pb::Value const& value) {
  switch (value.kind_case()) {
    case pb::Value::kNullValue: return "null";
    case pb::Value::kNumberValue: return "number";
    case pb::Value::kStringValue: return "string";
    case pb::Value::kBoolValue: return "bool";
    case pb::Value::kStructValue: return "object";
    case pb::Value::kListValue: return "array";
    default: return "nothing";
  }
}

namespace {

void expect(pb::Value const& value, pb::Value::KindCase kind, char const* expected) {
  if (value.kind_case() != kind) {
    throw ConversionError(StatusCode::PARAMETER_BINDING_FAILURE,
                          fmt::format("expected {} but received {}", expected, kind_name(value)));
  }
}

}  // namespace

pb::Value from_value(pb::Value const& value, Tag<pb::Value>) {
  return value;
}

pb::Struct from_value(pb::Value const& value, Tag<pb::Struct>) {
  expect(value, pb::Value::kStructValue, "object");
  return value.struct_value();
}

pb::ListValue from_value(pb::Value const& value, Tag<pb::ListValue>) {
  expect(value, pb::Value::kListValue, "array");
  return value.list_value();
}

std::string from_value(pb::Value const& value, Tag<std::string>) {
  expect(value, pb::Value::kStringValue, "string");
  return value.string_value();
}

bool from_value(pb::Value const& value, Tag<bool>) {
  expect(value, pb::Value::kBoolValue, "bool");
  return value.bool_value();
}

double from_value(pb::Value const& value, Tag<double>) {
  expect(value, pb::Value::kNumberValue, "number");
  return value.number_value();
}

}  // namespace detail

}  // namespace ichain
