#pragma once

#include <boost/asio/thread_pool.hpp>
#include <future>
#include <memory>
#include <vector>
#include "invoker.hpp"
#include "metadata-store.hpp"
#include "registry.hpp"
#include "task-tracker.hpp"

namespace ichain {

// Executes a chain of interceptors. The interceptors are grouped by type and every group runs
// with its own execution model:
//
//  * mutation: one after the other in (priority, id) order on the calling thread, each step gets
//    the payload produced by the previous one. The first failure stops the group.
//  * validation: all at once on the pool, each one sees the original payload. A failing
//    validator contributes a single ERROR finding, findings are reported in (priority, id) order.
//  * observability: launched on the pool and never awaited, their metadata and failures end up
//    in the metadata store.
//
// The groups don't depend on each other: a failed mutation group doesn't stop the validators or
// the observers of the same chain. The failure is raised as a ChainError once they are done.
class ChainExecutor {
  Registry const& registry;
  Invoker const& invoker;
  boost::asio::thread_pool& pool;
  TaskTracker& detached;
  MetadataStore& side_channel;

 public:
  using InterceptorPtr = std::shared_ptr<Interceptor const>;

  struct Groups {
    std::vector<InterceptorPtr> mutation;
    std::vector<InterceptorPtr> validation;
    std::vector<InterceptorPtr> observability;
  };

  ChainExecutor(Registry const& registry, Invoker const& invoker, boost::asio::thread_pool& pool,
                TaskTracker& detached, MetadataStore& side_channel);

  // Throws UNKNOWN_INTERCEPTOR_ID before running anything, ChainError if the mutation group was
  // aborted and CANCELLED if the call got cancelled.
  msgs::ExecuteChainResult execute(msgs::ExecuteChainRequest const& request,
                                   Context const& context) const;

  // Runs a single interceptor synchronously, whatever its type. Failures propagate untouched.
  msgs::InvokeInterceptorResult invoke(msgs::InvokeInterceptorRequest const& request,
                                       Context const& context) const;

  // Resolves, filters by phase and partitions the requested interceptors, each group sorted
  Groups plan(msgs::ExecuteChainRequest const& request) const;

 private:
  boost::optional<Error> run_mutations(std::vector<InterceptorPtr> const& mutations,
                                       msgs::ExecuteChainRequest const& request,
                                       Context const& context,
                                       msgs::ExecuteChainResult* result) const;

  std::vector<std::future<msgs::InvokeInterceptorResult>> start_validations(
      std::vector<InterceptorPtr> const& validations, msgs::ExecuteChainRequest const& request,
      Context const& context) const;

  void launch_observers(std::vector<InterceptorPtr> const& observers,
                        msgs::ExecuteChainRequest const& request, Context const& context) const;
};

}  // namespace ichain
