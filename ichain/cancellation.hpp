#pragma once

#include <atomic>
#include <memory>

namespace ichain {

// Observer side of a cancellation flag. Copies share the same flag, a default constructed token
// is never cancelled.
class CancellationToken {
  std::shared_ptr<std::atomic<bool>> flag;

 public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> const& f) : flag(f) {}

  bool cancelled() const { return flag && flag->load(); }
  bool can_be_cancelled() const { return flag != nullptr; }
};

class CancellationSource {
  std::shared_ptr<std::atomic<bool>> flag;

 public:
  CancellationSource() : flag(std::make_shared<std::atomic<bool>>(false)) {}

  CancellationToken token() const { return CancellationToken(flag); }
  void cancel() { flag->store(true); }
  bool cancelled() const { return flag->load(); }
};

}  // namespace ichain
