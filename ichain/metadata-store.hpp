#pragma once

#include <google/protobuf/map.h>
#include <boost/optional.hpp>
#include <map>
#include <mutex>
#include <string>
#include "core.hpp"

namespace ichain {

// Side channel fed by detached observability interceptors. Metadata is merged per interceptor id
// (later keys win), the last failure of every interceptor is kept for operational visibility.
class MetadataStore {
  mutable std::mutex mutex;
  std::map<std::string, pb::Struct> metadata;
  std::map<std::string, Status> failures;

 public:
  void merge(std::string const& id, pb::Map<std::string, pb::Value> const& values);
  void record_failure(std::string const& id, Status const& status);

  boost::optional<pb::Struct> metadata_of(std::string const& id) const;
  boost::optional<Status> failure_of(std::string const& id) const;

  // Everything merged so far as { id: { key: value } }, e.g. to be exported as JSON
  pb::Struct snapshot() const;
  std::size_t failure_count() const;
};

}  // namespace ichain
