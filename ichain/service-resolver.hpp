#pragma once

#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>

namespace ichain {

// Capability based access to the host's services. Types are the exact C++ type of the interceptor
// argument being bound, usually a std::shared_ptr<Service>.
struct ServiceResolver {
  virtual ~ServiceResolver() {}

  virtual bool can_resolve(std::type_index type) const = 0;
  virtual boost::optional<boost::any> resolve(std::type_index type) const = 0;
  virtual boost::optional<boost::any> resolve_keyed(std::type_index type,
                                                    std::string const& key) const = 0;
};

// Map backed resolver, enough for hosts that don't bring a container of their own.
class ServiceCollection : public ServiceResolver {
  std::map<std::type_index, boost::any> services;
  std::map<std::pair<std::type_index, std::string>, boost::any> keyed;

 public:
  template <typename T>
  ServiceCollection& add(std::shared_ptr<T> const& service) {
    services[std::type_index(typeid(std::shared_ptr<T>))] = service;
    return *this;
  }

  template <typename T>
  ServiceCollection& add_keyed(std::string const& key, std::shared_ptr<T> const& service) {
    keyed[std::make_pair(std::type_index(typeid(std::shared_ptr<T>)), key)] = service;
    return *this;
  }

  bool can_resolve(std::type_index type) const override;
  boost::optional<boost::any> resolve(std::type_index type) const override;
  boost::optional<boost::any> resolve_keyed(std::type_index type,
                                            std::string const& key) const override;
};

}  // namespace ichain
