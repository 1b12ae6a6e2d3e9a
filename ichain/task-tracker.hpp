#pragma once

#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "cancellation.hpp"

namespace ichain {

// Keeps track of fire-and-forget tasks running on a thread pool so none of them is silently lost
// on shutdown. Tasks get the shutdown token instead of the token of the call that launched them.
//
// Lifecycle: open on construction, drain() closes it for good. The pool must outlive the tracker
// and be joined before the tracker is destroyed.
class TaskTracker {
 public:
  using Task = std::function<void(CancellationToken const& shutdown)>;

 private:
  boost::asio::thread_pool& pool;
  CancellationSource shutdown;

  mutable std::mutex mutex;
  std::condition_variable finished;
  std::map<std::uint64_t, std::string> running;
  std::uint64_t next_id = 0;
  bool open = true;

 public:
  explicit TaskTracker(boost::asio::thread_pool& pool);

  TaskTracker(TaskTracker const&) = delete;
  TaskTracker& operator=(TaskTracker const&) = delete;

  // Returns false, without running the task, once the tracker was drained
  bool launch(std::string const& name, Task const& task);

  std::size_t in_flight() const;
  bool is_open() const;

  // Blocks until every task in flight is done, at most for the grace period. Tasks still running
  // after that get the shutdown signal. Returns how many of them did not finish in time.
  std::size_t drain(std::chrono::milliseconds grace);

 private:
  void done(std::uint64_t id);
};

}  // namespace ichain
