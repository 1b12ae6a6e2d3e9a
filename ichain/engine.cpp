#include "engine.hpp"
#include <algorithm>
#include <thread>

namespace ichain {

namespace {

msgs::EngineOptions with_defaults(msgs::EngineOptions options) {
  if (options.worker_threads() == 0) {
    options.set_worker_threads(std::max(2u, std::thread::hardware_concurrency()));
  }
  if (options.drain_timeout_ms() == 0) {
    options.set_drain_timeout_ms(Engine::kDefaultDrainTimeoutMs);
  }
  if (options.page_size() == 0) options.set_page_size(Engine::kDefaultPageSize);
  return options;
}

std::vector<DescriptorOverride> overrides_of(msgs::EngineOptions const& options) {
  return std::vector<DescriptorOverride>(options.overrides().begin(), options.overrides().end());
}

}  // namespace

constexpr unsigned Engine::kDefaultDrainTimeoutMs;
constexpr unsigned Engine::kDefaultPageSize;

Engine::Engine(msgs::EngineOptions const& engine_options)
    : options(with_defaults(engine_options)),
      registry(overrides_of(options)),
      pool(options.worker_threads()),
      detached(pool),
      executor(registry, invoker, pool, detached, side_channel) {
  info("Interceptor engine started with {} worker threads", options.worker_threads());
}

Engine::~Engine() {
  shutdown();
}

msgs::InvokeInterceptorResult Engine::invoke(msgs::InvokeInterceptorRequest const& request,
                                             Context const& context) const {
  return executor.invoke(request, context);
}

msgs::ExecuteChainResult Engine::execute_chain(msgs::ExecuteChainRequest const& request,
                                               Context const& context) const {
  return executor.execute(request, context);
}

msgs::ExecuteChainResult Engine::execute_applicable(std::string const& event,
                                                    InterceptorPhase phase,
                                                    pb::Value const& payload,
                                                    Context const& context) const {
  msgs::ExecuteChainRequest request;
  request.set_event(event);
  request.set_phase(phase);
  *request.mutable_payload() = payload;
  for (auto&& interceptor : registry.lookup(event, phase)) {
    request.add_interceptor_ids(interceptor->id());
  }
  return executor.execute(request, context);
}

msgs::ListInterceptorsResult Engine::list(msgs::ListInterceptorsRequest const& request) const {
  auto page = registry.list(request.cursor(), options.page_size());
  msgs::ListInterceptorsResult result;
  for (auto&& descriptor : page.interceptors) {
    *result.add_interceptors() = descriptor;
  }
  result.set_next_cursor(page.next_cursor);
  return result;
}

std::size_t Engine::shutdown() {
  std::size_t lost = 0;
  std::call_once(stopped, [this, &lost] {
    auto grace = std::chrono::milliseconds(options.drain_timeout_ms());
    lost = detached.drain(grace);
    if (lost > 0) {
      warn("{} detached tasks did not finish during shutdown", lost);
      // queued work that didn't start yet is abandoned
      pool.stop();
    }
    pool.join();
    info("Interceptor engine stopped");
  });
  return lost;
}

}  // namespace ichain
