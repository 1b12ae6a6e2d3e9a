#pragma once

#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>
#include "core.hpp"
#include "errors.hpp"

namespace ichain {

enum class ParameterSource {
  // Well-known context value, service or payload field, whichever matches first
  Automatic,
  // Always taken from the service resolver
  Service,
  // Taken from the service resolver under an explicit key
  KeyedService,
};

// One argument of an interceptor. The untyped part is declared by the user with arg(), service()
// and keyed_service(), the typed part is filled in by make_interceptor from the callable.
struct Parameter {
  std::string name;
  ParameterSource source = ParameterSource::Automatic;
  std::string key;
  boost::optional<pb::Value> default_value;
  bool optional = false;

  std::type_index type = typeid(void);
  std::function<boost::any(pb::Value const&)> convert;
  std::function<boost::any()> fallback;
};

Parameter arg(std::string const& name);
Parameter arg(std::string const& name, pb::Value const& default_value);
Parameter service(std::string const& name);
// Bound to an empty value (e.g. a null shared_ptr) when the resolver doesn't know the type
Parameter optional_service(std::string const& name);
// An empty key resolves the service using the parameter name as the key
Parameter keyed_service(std::string const& name, std::string const& key = "");

// Thrown by the payload converters, the binder attaches the interceptor and parameter names.
class ConversionError : public Error {
 public:
  ConversionError(StatusCode code, std::string const& what) : Error(code, what) {}
};

namespace detail {

template <typename T>
struct Tag {};

std::string kind_name(pb::Value const& value);

pb::Value from_value(pb::Value const& value, Tag<pb::Value>);
pb::Struct from_value(pb::Value const& value, Tag<pb::Struct>);
pb::ListValue from_value(pb::Value const& value, Tag<pb::ListValue>);
std::string from_value(pb::Value const& value, Tag<std::string>);
bool from_value(pb::Value const& value, Tag<bool>);
double from_value(pb::Value const& value, Tag<double>);

template <typename T>
typename std::enable_if<std::is_integral<T>::value, T>::type from_value(pb::Value const& value,
                                                                        Tag<T>) {
  auto number = from_value(value, Tag<double>{});
  if (std::trunc(number) != number || number < static_cast<double>(std::numeric_limits<T>::lowest()) ||
      number > static_cast<double>(std::numeric_limits<T>::max())) {
    throw ConversionError(StatusCode::PARAMETER_BINDING_FAILURE,
                          fmt::format("{} doesn't fit an integer argument", number));
  }
  return static_cast<T>(number);
}

template <typename T>
typename std::enable_if<std::is_floating_point<T>::value && !std::is_same<T, double>::value,
                        T>::type
from_value(pb::Value const& value, Tag<T>) {
  return static_cast<T>(from_value(value, Tag<double>{}));
}

// Any other protobuf message goes through its JSON mapping
template <typename T>
typename std::enable_if<std::is_base_of<pb::Message, T>::value &&
                            !std::is_same<T, pb::Value>::value &&
                            !std::is_same<T, pb::Struct>::value &&
                            !std::is_same<T, pb::ListValue>::value,
                        T>::type
from_value(pb::Value const& value, Tag<T>) {
  std::string json;
  T message;
  if (!pb::MessageToJsonString(value, &json).ok() || !pb::JsonStringToMessage(json, &message).ok()) {
    throw ConversionError(StatusCode::SERIALIZATION_ERROR,
                          fmt::format("Expected type '{}' but received something else",
                                      T::descriptor()->full_name()));
  }
  return message;
}

template <typename T>
std::vector<T> from_value(pb::Value const& value, Tag<std::vector<T>>) {
  std::vector<T> items;
  auto list = from_value(value, Tag<pb::ListValue>{});
  for (auto&& item : list.values()) {
    items.push_back(from_value(item, Tag<T>{}));
  }
  return items;
}

template <typename T>
boost::optional<T> from_value(pb::Value const& value, Tag<boost::optional<T>>) {
  if (value.kind_case() == pb::Value::kNullValue) return boost::none;
  return from_value(value, Tag<T>{});
}

// Types that can be deserialized from a payload field
template <typename T>
struct is_payload_type
    : std::integral_constant<bool, std::is_arithmetic<T>::value ||
                                       std::is_base_of<pb::Message, T>::value ||
                                       std::is_same<T, std::string>::value> {};
template <typename T>
struct is_payload_type<std::vector<T>> : is_payload_type<T> {};
template <typename T>
struct is_payload_type<boost::optional<T>> : is_payload_type<T> {};

template <typename T>
std::function<boost::any(pb::Value const&)> make_converter(std::true_type) {
  return [](pb::Value const& value) { return boost::any(from_value(value, Tag<T>{})); };
}

template <typename T>
std::function<boost::any(pb::Value const&)> make_converter(std::false_type) {
  return [](pb::Value const&) -> boost::any {
    throw ConversionError(StatusCode::PARAMETER_BINDING_FAILURE,
                          "argument type can't be deserialized from the payload");
  };
}

template <typename T>
std::function<boost::any()> make_empty(std::true_type) {
  return [] { return boost::any(T{}); };
}

template <typename T>
std::function<boost::any()> make_empty(std::false_type) {
  return nullptr;
}

}  // namespace detail

// Completes a declared parameter with everything that depends on the argument type T.
template <typename T>
Parameter typed(Parameter parameter) {
  parameter.type = typeid(T);
  parameter.convert = detail::make_converter<T>(detail::is_payload_type<T>{});
  if (parameter.default_value) {
    auto convert = parameter.convert;
    auto value = *parameter.default_value;
    parameter.fallback = [convert, value] { return convert(value); };
  } else if (parameter.optional) {
    parameter.fallback = detail::make_empty<T>(std::is_default_constructible<T>{});
  }
  return parameter;
}

}  // namespace ichain
