#include "descriptor.hpp"
#include <algorithm>
#include <cctype>
#include "errors.hpp"

namespace ichain {

Descriptor make_descriptor(CreateOptions const& options, std::string const& function_name) {
  Descriptor descriptor;
  auto id = options.id.empty() ? derive_id(function_name) : options.id;
  if (id.empty()) {
    throw Error(StatusCode::INVALID_ARGUMENT,
                "Interceptor id must be given explicitly or derived from a function name");
  }
  if (options.type == InterceptorType::TYPE_UNSPECIFIED) {
    throw Error(StatusCode::INVALID_ARGUMENT,
                "Interceptor type must be specified for '" + id + "'", id);
  }

  descriptor.set_id(id);
  descriptor.set_name(options.name.empty() ? id : options.name);
  descriptor.set_description(options.description);
  descriptor.set_type(options.type);
  descriptor.set_priority(options.priority);
  for (auto&& event : options.applicable_events) {
    descriptor.add_applicable_events(event);
  }
  for (auto&& phase : options.phases) {
    descriptor.add_phases(phase);
  }
  return descriptor;
}

std::string derive_id(std::string const& function_name) {
  std::string name = function_name;
  auto strip = [&](std::string const& suffix) {
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
      name.erase(name.size() - suffix.size());
    }
  };
  strip("Async");
  strip("_async");

  std::string id;
  for (std::size_t i = 0; i < name.size(); ++i) {
    auto c = static_cast<unsigned char>(name[i]);
    if (i > 0 && std::isupper(c) && std::islower(static_cast<unsigned char>(name[i - 1]))) {
      id += '_';
    }
    id += static_cast<char>(std::tolower(c));
  }
  return id;
}

bool applies_to_event(Descriptor const& descriptor, std::string const& event) {
  auto const& events = descriptor.applicable_events();
  return events.empty() || std::find(events.begin(), events.end(), event) != events.end();
}

bool applies_to_phase(Descriptor const& descriptor, InterceptorPhase phase) {
  auto const& phases = descriptor.phases();
  return phases.empty() || std::find(phases.begin(), phases.end(), phase) != phases.end();
}

bool applies_to(Descriptor const& descriptor, std::string const& event, InterceptorPhase phase) {
  return applies_to_event(descriptor, event) && applies_to_phase(descriptor, phase);
}

bool execution_order(Descriptor const& lhs, Descriptor const& rhs) {
  if (lhs.priority() != rhs.priority()) return lhs.priority() < rhs.priority();
  return lhs.id() < rhs.id();
}

void apply_override(Descriptor* descriptor, DescriptorOverride const& override) {
  if (!override.name().empty()) descriptor->set_name(override.name());
  if (!override.description().empty()) descriptor->set_description(override.description());
  if (override.has_priority()) descriptor->set_priority(override.priority());
  if (override.applicable_events_size() > 0) {
    *descriptor->mutable_applicable_events() = override.applicable_events();
  }
  if (override.phases_size() > 0) { *descriptor->mutable_phases() = override.phases(); }
}

}  // namespace ichain
