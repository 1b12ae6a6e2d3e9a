#pragma once

#include <ichain/msgs/interceptor.pb.h>
#include <string>
#include <vector>

namespace ichain {

using Descriptor = msgs::Interceptor;
using DescriptorOverride = msgs::InterceptorOverride;
using msgs::InterceptorPhase;
using msgs::InterceptorType;

struct CreateOptions {
  // Derived from the function name when empty
  std::string id;
  // Defaults to the id
  std::string name;
  std::string description;
  InterceptorType type = InterceptorType::TYPE_UNSPECIFIED;
  int priority = 0;
  std::vector<std::string> applicable_events;
  std::vector<InterceptorPhase> phases;
};

// Builds the descriptor of a new interceptor. Throws INVALID_ARGUMENT when no id can be
// determined or when the type was left unspecified.
Descriptor make_descriptor(CreateOptions const& options, std::string const& function_name = "");

// "RedactEmailsAsync" -> "redact_emails"
std::string derive_id(std::string const& function_name);

bool applies_to_event(Descriptor const& descriptor, std::string const& event);
bool applies_to_phase(Descriptor const& descriptor, InterceptorPhase phase);
bool applies_to(Descriptor const& descriptor, std::string const& event, InterceptorPhase phase);

// Strict weak ordering by (priority, id), the execution order inside a kind.
bool execution_order(Descriptor const& lhs, Descriptor const& rhs);

// Replaces the configurable fields of descriptor with the ones from the override. The id and type
// are kept, fields left empty in the override are kept too.
void apply_override(Descriptor* descriptor, DescriptorOverride const& override);

}  // namespace ichain
