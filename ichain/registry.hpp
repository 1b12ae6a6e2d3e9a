#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "interceptor.hpp"

namespace ichain {

// Live set of interceptors. Reads work on immutable snapshots and never wait for a registration
// in progress, writers serialize among themselves and publish a new snapshot when done.
class Registry {
 public:
  using Snapshot = std::map<std::string, std::shared_ptr<Interceptor const>>;
  using ChangeListener = std::function<void()>;

  struct Page {
    std::vector<Descriptor> interceptors;
    // Empty on the last page
    std::string next_cursor;
  };

 private:
  std::shared_ptr<Snapshot const> current;
  std::mutex writer;
  std::vector<ChangeListener> listeners;
  std::vector<DescriptorOverride> overrides;

 public:
  Registry();
  explicit Registry(std::vector<DescriptorOverride> const& descriptor_overrides);

  // Throws DUPLICATE_ID if an interceptor with the same id is already registered
  void add(Interceptor const& interceptor);
  bool remove(std::string const& id);

  // Throws UNKNOWN_INTERCEPTOR_ID
  std::shared_ptr<Interceptor const> resolve(std::string const& id) const;

  // Interceptors applicable to the event and phase in (priority, id) order
  std::vector<std::shared_ptr<Interceptor const>> lookup(std::string const& event,
                                                         InterceptorPhase phase) const;

  // Descriptors sorted by id, page_size at most, starting right after the cursor
  Page list(std::string const& cursor, std::size_t page_size) const;

  std::shared_ptr<Snapshot const> snapshot() const;
  std::size_t size() const { return snapshot()->size(); }

  // Called after every change to the set, outside of any lock
  void on_change(ChangeListener const& listener);

 private:
  void notify();
};

}  // namespace ichain
