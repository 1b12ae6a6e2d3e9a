#pragma once

#include <ichain/interceptor.hpp>
#include <string>
#include <vector>

namespace email {

// "alice@example.com" -> "[REDACTED_EMAIL]". Sets changed when anything was replaced.
std::string redact(std::string const& text, bool* changed = nullptr);

// Addresses found in text, in order of appearance.
std::vector<std::string> find_addresses(std::string const& text);

// Mutation, priority 10: replaces e-mail addresses anywhere in the payload.
ichain::Interceptor redactor();

// Validation, priority 5, responses only: one WARNING per address still present.
ichain::Interceptor leak_validator();

// Observability, priority 1: logs the event and phase of every call it sees.
ichain::Interceptor request_logger();

std::vector<ichain::Interceptor> interceptors();

}  // namespace email
