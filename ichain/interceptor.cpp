#include "interceptor.hpp"

namespace ichain {

Interceptor::Interceptor(Descriptor const& descriptor, std::vector<Parameter> parameters,
                         Handler handler, Activator activator)
    : desc(descriptor),
      params(std::move(parameters)),
      handler(std::move(handler)),
      activator(std::move(activator)) {}

Interceptor Interceptor::with_descriptor(Descriptor const& descriptor) const {
  Interceptor copy(*this);
  copy.desc = descriptor;
  return copy;
}

namespace detail {

void check_arity(Descriptor const& descriptor, std::size_t declared, std::size_t expected) {
  if (declared != expected) {
    throw Error(StatusCode::INVALID_ARGUMENT,
                fmt::format("Interceptor '{}' declares {} parameters but its callable takes {}",
                            descriptor.id(), declared, expected),
                descriptor.id());
  }
}

}  // namespace detail

}  // namespace ichain
