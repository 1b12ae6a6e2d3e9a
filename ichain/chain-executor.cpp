#include "chain-executor.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <set>

namespace ichain {

namespace {

using InterceptorPtr = ChainExecutor::InterceptorPtr;

msgs::InvokeInterceptorRequest step_request(std::string const& id,
                                            msgs::ExecuteChainRequest const& chain,
                                            pb::Value const* payload) {
  msgs::InvokeInterceptorRequest request;
  request.set_interceptor_id(id);
  request.set_event(chain.event());
  request.set_phase(chain.phase());
  if (payload != nullptr) *request.mutable_payload() = *payload;
  if (chain.has_meta()) *request.mutable_meta() = chain.meta();
  return request;
}

pb::Value const* original_payload(msgs::ExecuteChainRequest const& request) {
  return request.has_payload() ? &request.payload() : nullptr;
}

// Metadata of every interceptor is kept under its own id so keys never collide
void merge_metadata(std::string const& id, msgs::InvokeInterceptorResult const& output,
                    msgs::ExecuteChainResult* result) {
  if (output.metadata().empty()) return;
  auto fields = (*result->mutable_metadata())[id].mutable_struct_value()->mutable_fields();
  for (auto&& key_value : output.metadata()) {
    (*fields)[key_value.first] = key_value.second;
  }
}

msgs::ValidationResult failure_finding(std::string const& id, Error const& error) {
  msgs::ValidationResult finding;
  finding.set_severity(msgs::ValidationSeverity::ERROR);
  finding.set_message(fmt::format("Validator '{}' failed with {}: {}", id,
                                  msgs::StatusCode_Name(error.code()), error.what()));
  return finding;
}

void sort_group(std::vector<InterceptorPtr>* group) {
  std::sort(group->begin(), group->end(), [](InterceptorPtr const& lhs, InterceptorPtr const& rhs) {
    return execution_order(lhs->descriptor(), rhs->descriptor());
  });
}

}  // namespace

ChainExecutor::ChainExecutor(Registry const& r, Invoker const& i, boost::asio::thread_pool& p,
                             TaskTracker& d, MetadataStore& s)
    : registry(r), invoker(i), pool(p), detached(d), side_channel(s) {}

ChainExecutor::Groups ChainExecutor::plan(msgs::ExecuteChainRequest const& request) const {
  // every id is resolved against the same snapshot before anything runs
  auto snapshot = registry.snapshot();
  std::set<std::string> seen;
  std::vector<InterceptorPtr> resolved;
  for (auto&& id : request.interceptor_ids()) {
    if (!seen.insert(id).second) continue;
    auto found = snapshot->find(id);
    if (found == snapshot->end()) throw unknown_interceptor_id(id);
    resolved.push_back(found->second);
  }

  Groups groups;
  for (auto&& interceptor : resolved) {
    if (!applies_to_phase(interceptor->descriptor(), request.phase())) {
      debug("Skipping '{}', it doesn't apply to the {} phase", interceptor->id(),
            msgs::InterceptorPhase_Name(request.phase()));
      continue;
    }

    switch (interceptor->type()) {
      case InterceptorType::MUTATION: groups.mutation.push_back(interceptor); break;
      case InterceptorType::VALIDATION: groups.validation.push_back(interceptor); break;
      case InterceptorType::OBSERVABILITY: groups.observability.push_back(interceptor); break;
      default: warn("Skipping '{}', it has no interceptor type", interceptor->id());
    }
  }

  sort_group(&groups.mutation);
  sort_group(&groups.validation);
  sort_group(&groups.observability);
  return groups;
}

msgs::ExecuteChainResult ChainExecutor::execute(msgs::ExecuteChainRequest const& request,
                                                Context const& context) const {
  auto groups = plan(request);

  msgs::ExecuteChainResult result;
  if (request.has_payload()) *result.mutable_modified_payload() = request.payload();

  launch_observers(groups.observability, request, context);
  auto validations = start_validations(groups.validation, request, context);
  auto failure = run_mutations(groups.mutation, request, context, &result);

  for (std::size_t i = 0; i < validations.size(); ++i) {
    auto output = validations[i].get();
    for (auto&& finding : output.validation_results()) {
      *result.add_all_validation_results() = finding;
    }
    merge_metadata(groups.validation[i]->id(), output, &result);
  }

  if (failure) {
    warn("Mutation group aborted at '{}': {}", failure->interceptor_id(), failure->what());
    throw ChainError(*failure, result);
  }
  if (context.cancelled()) throw Error(StatusCode::CANCELLED, "Chain execution was cancelled");
  return result;
}

msgs::InvokeInterceptorResult ChainExecutor::invoke(msgs::InvokeInterceptorRequest const& request,
                                                    Context const& context) const {
  auto interceptor = registry.resolve(request.interceptor_id());
  if (!applies_to_phase(interceptor->descriptor(), request.phase())) {
    debug("Skipping '{}', it doesn't apply to the {} phase", interceptor->id(),
          msgs::InterceptorPhase_Name(request.phase()));
    return {};
  }
  return invoker.invoke(*interceptor, request, context);
}

boost::optional<Error> ChainExecutor::run_mutations(std::vector<InterceptorPtr> const& mutations,
                                                    msgs::ExecuteChainRequest const& request,
                                                    Context const& context,
                                                    msgs::ExecuteChainResult* result) const {
  for (auto&& mutation : mutations) {
    if (context.cancelled()) {
      return Error(StatusCode::CANCELLED,
                   fmt::format("Chain cancelled before '{}' could run", mutation->id()),
                   mutation->id());
    }

    auto payload = result->has_modified_payload() ? &result->modified_payload() : nullptr;
    auto step = step_request(mutation->id(), request, payload);
    try {
      auto output = invoker.invoke(*mutation, step, context);
      if (output.has_modified_payload()) {
        *result->mutable_modified_payload() = output.modified_payload();
      }
      merge_metadata(mutation->id(), output, result);
    } catch (Error const& e) {
      return e;
    }
  }
  return boost::none;
}

std::vector<std::future<msgs::InvokeInterceptorResult>> ChainExecutor::start_validations(
    std::vector<InterceptorPtr> const& validations, msgs::ExecuteChainRequest const& request,
    Context const& context) const {
  std::vector<std::future<msgs::InvokeInterceptorResult>> outputs;
  for (auto&& validation : validations) {
    auto step = step_request(validation->id(), request, original_payload(request));
    auto task = std::make_shared<std::packaged_task<msgs::InvokeInterceptorResult()>>(
        [this, validation, step, context]() -> msgs::InvokeInterceptorResult {
          if (context.cancelled()) return {};
          try {
            return invoker.invoke(*validation, step, context);
          } catch (Error const& e) {
            msgs::InvokeInterceptorResult failed;
            *failed.add_validation_results() = failure_finding(validation->id(), e);
            return failed;
          }
        });
    outputs.push_back(task->get_future());
    boost::asio::post(pool, [task] { (*task)(); });
  }
  return outputs;
}

void ChainExecutor::launch_observers(std::vector<InterceptorPtr> const& observers,
                                     msgs::ExecuteChainRequest const& request,
                                     Context const& context) const {
  for (auto&& observer : observers) {
    auto step = step_request(observer->id(), request, original_payload(request));
    // detached from the caller: no cancellation and nobody left to receive progress
    Context call(context.id());
    call.with_services(context.services()).with_server(context.server());

    auto launched = detached.launch(
        observer->id(), [this, observer, step, call](CancellationToken const& shutdown) {
          auto observed = call;
          observed.with_token(shutdown);
          try {
            auto output = invoker.invoke(*observer, step, observed);
            side_channel.merge(observer->id(), output.metadata());
          } catch (Error const& e) {
            side_channel.record_failure(observer->id(), e.status());
            warn("Observability interceptor '{}' failed: {}", observer->id(), e.what());
          }
        });

    if (!launched) {
      auto why = "Engine is shutting down, observer was not launched";
      side_channel.record_failure(observer->id(),
                                  make_status(StatusCode::CANCELLED, why, observer->id()));
      warn("{}: '{}'", why, observer->id());
    }
  }
}

}  // namespace ichain
