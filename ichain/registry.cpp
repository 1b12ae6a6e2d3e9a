#include "registry.hpp"
#include <algorithm>
#include <atomic>

namespace ichain {

Registry::Registry() : current(std::make_shared<Snapshot const>()) {}

Registry::Registry(std::vector<DescriptorOverride> const& descriptor_overrides) : Registry() {
  overrides = descriptor_overrides;
}

void Registry::add(Interceptor const& interceptor) {
  auto descriptor = interceptor.descriptor();
  for (auto&& override : overrides) {
    if (override.id() == descriptor.id()) apply_override(&descriptor, override);
  }

  {
    std::lock_guard<std::mutex> lock(writer);
    auto snapshot = std::atomic_load(&current);
    if (snapshot->count(descriptor.id())) throw duplicate_id(descriptor.id());

    auto next = std::make_shared<Snapshot>(*snapshot);
    next->emplace(descriptor.id(),
                  std::make_shared<Interceptor const>(interceptor.with_descriptor(descriptor)));
    std::atomic_store(&current, std::shared_ptr<Snapshot const>(next));
  }

  info("Registered {} interceptor '{}' with priority {}",
       msgs::InterceptorType_Name(descriptor.type()), descriptor.id(), descriptor.priority());
  notify();
}

bool Registry::remove(std::string const& id) {
  {
    std::lock_guard<std::mutex> lock(writer);
    auto snapshot = std::atomic_load(&current);
    if (!snapshot->count(id)) return false;

    auto next = std::make_shared<Snapshot>(*snapshot);
    next->erase(id);
    std::atomic_store(&current, std::shared_ptr<Snapshot const>(next));
  }

  info("Unregistered interceptor '{}'", id);
  notify();
  return true;
}

std::shared_ptr<Interceptor const> Registry::resolve(std::string const& id) const {
  auto snapshot = this->snapshot();
  auto found = snapshot->find(id);
  if (found == snapshot->end()) throw unknown_interceptor_id(id);
  return found->second;
}

std::vector<std::shared_ptr<Interceptor const>> Registry::lookup(std::string const& event,
                                                                 InterceptorPhase phase) const {
  std::vector<std::shared_ptr<Interceptor const>> applicable;
  for (auto&& key_value : *snapshot()) {
    if (applies_to(key_value.second->descriptor(), event, phase)) {
      applicable.push_back(key_value.second);
    }
  }
  std::sort(applicable.begin(), applicable.end(),
            [](std::shared_ptr<Interceptor const> const& lhs,
               std::shared_ptr<Interceptor const> const& rhs) {
              return execution_order(lhs->descriptor(), rhs->descriptor());
            });
  return applicable;
}

Registry::Page Registry::list(std::string const& cursor, std::size_t page_size) const {
  auto snapshot = this->snapshot();
  auto first = cursor.empty() ? snapshot->begin() : snapshot->upper_bound(cursor);

  Page page;
  for (auto it = first; it != snapshot->end(); ++it) {
    if (page_size > 0 && page.interceptors.size() == page_size) {
      page.next_cursor = page.interceptors.back().id();
      break;
    }
    page.interceptors.push_back(it->second->descriptor());
  }
  return page;
}

std::shared_ptr<Registry::Snapshot const> Registry::snapshot() const {
  return std::atomic_load(&current);
}

void Registry::on_change(ChangeListener const& listener) {
  std::lock_guard<std::mutex> lock(writer);
  listeners.push_back(listener);
}

void Registry::notify() {
  std::vector<ChangeListener> to_notify;
  {
    std::lock_guard<std::mutex> lock(writer);
    to_notify = listeners;
  }
  for (auto&& listener : to_notify) {
    try {
      listener();
    } catch (std::exception const& e) {
      warn("Interceptor list change listener failed: {}", e.what());
    }
  }
}

}  // namespace ichain
