#pragma once

#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <mutex>
#include "chain-executor.hpp"

namespace ichain {

// Owns everything an interceptor server needs: the registry, the invoker with its hooks, the
// worker pool, the tracker of detached tasks and the metadata side channel. Destroying the engine
// drains the detached tasks with the configured grace period.
class Engine {
  msgs::EngineOptions options;
  Registry registry;
  Invoker invoker;
  MetadataStore side_channel;
  boost::asio::thread_pool pool;
  TaskTracker detached;
  ChainExecutor executor;
  std::once_flag stopped;

 public:
  static constexpr unsigned kDefaultDrainTimeoutMs = 5000;
  static constexpr unsigned kDefaultPageSize = 50;

  explicit Engine(msgs::EngineOptions const& options = msgs::EngineOptions());
  ~Engine();

  Engine(Engine const&) = delete;
  Engine& operator=(Engine const&) = delete;

  Registry& get_registry() { return registry; }
  Registry const& get_registry() const { return registry; }
  Invoker& get_invoker() { return invoker; }
  MetadataStore const& get_side_channel() const { return side_channel; }
  TaskTracker const& get_tasks() const { return detached; }
  msgs::EngineOptions const& get_options() const { return options; }

  void add(Interceptor const& interceptor) { registry.add(interceptor); }

  msgs::InvokeInterceptorResult invoke(msgs::InvokeInterceptorRequest const& request,
                                       Context const& context = Context()) const;

  msgs::ExecuteChainResult execute_chain(msgs::ExecuteChainRequest const& request,
                                         Context const& context = Context()) const;

  // Chain made of every interceptor registered for the event and phase
  msgs::ExecuteChainResult execute_applicable(std::string const& event, InterceptorPhase phase,
                                              pb::Value const& payload,
                                              Context const& context = Context()) const;

  msgs::ListInterceptorsResult list(msgs::ListInterceptorsRequest const& request) const;

  // Waits for detached tasks within the drain timeout and stops the pool. Returns the number of
  // tasks that didn't finish in time. Safe to call more than once and from several threads, later
  // calls wait for the first one and return 0.
  std::size_t shutdown();
};

}  // namespace ichain
