#include "task-tracker.hpp"
#include <boost/asio/post.hpp>
#include "logger.hpp"

namespace ichain {

TaskTracker::TaskTracker(boost::asio::thread_pool& p) : pool(p) {}

bool TaskTracker::launch(std::string const& name, Task const& task) {
  std::uint64_t id;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!open) return false;
    id = next_id++;
    running.emplace(id, name);
  }

  auto token = shutdown.token();
  boost::asio::post(pool, [this, id, name, task, token] {
    try {
      task(token);
    } catch (std::exception const& e) {
      warn("Detached task '{}' failed: {}", name, e.what());
    } catch (...) {
      warn("Detached task '{}' failed with an unknown exception", name);
    }
    done(id);
  });
  return true;
}

std::size_t TaskTracker::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex);
  return running.size();
}

bool TaskTracker::is_open() const {
  std::lock_guard<std::mutex> lock(mutex);
  return open;
}

std::size_t TaskTracker::drain(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(mutex);
  open = false;
  finished.wait_for(lock, grace, [this] { return running.empty(); });
  if (running.empty()) return 0;

  shutdown.cancel();
  for (auto&& task : running) {
    warn("Detached task '{}' still running after {}ms", task.second, grace.count());
  }
  return running.size();
}

void TaskTracker::done(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex);
  running.erase(id);
  if (running.empty()) finished.notify_all();
}

}  // namespace ichain
