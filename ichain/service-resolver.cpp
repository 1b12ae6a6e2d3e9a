#include "service-resolver.hpp"

namespace ichain {

bool ServiceCollection::can_resolve(std::type_index type) const {
  return services.count(type) > 0;
}

boost::optional<boost::any> ServiceCollection::resolve(std::type_index type) const {
  auto found = services.find(type);
  if (found == services.end()) return boost::none;
  return found->second;
}

boost::optional<boost::any> ServiceCollection::resolve_keyed(std::type_index type,
                                                             std::string const& key) const {
  auto found = keyed.find(std::make_pair(type, key));
  if (found == keyed.end()) return boost::none;
  return found->second;
}

}  // namespace ichain
