#include "metrics-hook.hpp"
#include "../core.hpp"

namespace ichain {
namespace rpc {

MetricsHook::MetricsHook(std::shared_ptr<prometheus::Registry> const& reg)
    : registry(reg),
      boundaries{1.0, 2.5, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0} {
  invocations_family = &prometheus::BuildCounter()
                            .Name("interceptor_invocations_total")
                            .Help("Number of interceptor invocations by status code")
                            .Register(*registry);

  latency_family = &prometheus::BuildHistogram()
                        .Name("interceptor_duration_ms")
                        .Help("Interceptor invocation latency in milliseconds")
                        .Register(*registry);
}

void MetricsHook::before_invoke(InvocationContext*) {}

void MetricsHook::after_invoke(InvocationContext* context) {
  auto duration = pb::TimeUtil::DurationToMilliseconds(current_time() - context->started_at);
  auto const& id = context->descriptor->id();
  auto code = msgs::StatusCode_Name(context->status.code());

  std::lock_guard<std::mutex> lock(mutex);
  invocations_family->Add({{"interceptor", id}, {"code", code}}).Increment();
  latency_histogram(id)->Observe(duration);
}

prometheus::Histogram* MetricsHook::latency_histogram(std::string const& id) {
  auto key_value = latency_histograms.find(id);
  if (key_value != latency_histograms.end()) return key_value->second;

  auto histogram = &latency_family->Add({{"interceptor", id}}, boundaries);
  latency_histograms.emplace(id, histogram);
  return histogram;
}

}  // namespace rpc
}  // namespace ichain
