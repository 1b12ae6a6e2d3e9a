#include "metadata-store.hpp"

namespace ichain {

void MetadataStore::merge(std::string const& id, pb::Map<std::string, pb::Value> const& values) {
  if (values.empty()) return;
  std::lock_guard<std::mutex> lock(mutex);
  auto fields = metadata[id].mutable_fields();
  for (auto&& key_value : values) {
    (*fields)[key_value.first] = key_value.second;
  }
}

void MetadataStore::record_failure(std::string const& id, Status const& status) {
  std::lock_guard<std::mutex> lock(mutex);
  failures[id] = status;
}

boost::optional<pb::Struct> MetadataStore::metadata_of(std::string const& id) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto found = metadata.find(id);
  if (found == metadata.end()) return boost::none;
  return found->second;
}

boost::optional<Status> MetadataStore::failure_of(std::string const& id) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto found = failures.find(id);
  if (found == failures.end()) return boost::none;
  return found->second;
}

pb::Struct MetadataStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  pb::Struct all;
  for (auto&& key_value : metadata) {
    *(*all.mutable_fields())[key_value.first].mutable_struct_value() = key_value.second;
  }
  return all;
}

std::size_t MetadataStore::failure_count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return failures.size();
}

}  // namespace ichain
