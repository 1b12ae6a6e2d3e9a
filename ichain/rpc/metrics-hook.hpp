#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <mutex>
#include <unordered_map>
#include "../hook.hpp"

namespace ichain {
namespace rpc {

/* Go to: https://github.com/jupp0r/prometheus-cpp/ for more API details;

  prometheus::Exposer exposer("127.0.0.1:8080");
  auto registry = std::make_shared<prometheus::Registry>();
  exposer.RegisterCollectable(registry);
  invoker.add_hook<MetricsHook>(registry);
*/

// Per interceptor invocation counters by status code and a latency histogram.
class MetricsHook : public ExecutionHook {
  std::shared_ptr<prometheus::Registry> registry;

  prometheus::Family<prometheus::Counter>* invocations_family;
  prometheus::Family<prometheus::Histogram>* latency_family;
  prometheus::Histogram::BucketBoundaries boundaries;

  std::mutex mutex;
  std::unordered_map<std::string, prometheus::Histogram*> latency_histograms;

 public:
  MetricsHook(std::shared_ptr<prometheus::Registry> const& registry);

  void before_invoke(InvocationContext* context) override;
  void after_invoke(InvocationContext* context) override;

 private:
  prometheus::Histogram* latency_histogram(std::string const& id);
};

}  // namespace rpc
}  // namespace ichain
