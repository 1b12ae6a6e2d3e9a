#include "email-interceptors.hpp"
#include <regex>

namespace email {

using ichain::InterceptorPhase;
using ichain::InterceptorType;
using ichain::msgs::InvokeInterceptorRequest;
using ichain::msgs::InvokeInterceptorResult;

namespace {

std::regex const& address_pattern() {
  static const std::regex pattern(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)");
  return pattern;
}

InvokeInterceptorResult redact_emails(InvokeInterceptorRequest const& request) {
  InvokeInterceptorResult result;
  if (!request.has_payload()) return result;

  bool changed = false;
  auto json = ichain::to_json(request.payload());
  auto redacted = ichain::parse_value(redact(json, &changed));
  if (!redacted) {
    throw ichain::Error(ichain::StatusCode::SERIALIZATION_ERROR,
                        "Redacted payload is no longer valid JSON", "email-redactor");
  }

  *result.mutable_modified_payload() = *redacted;
  auto& metadata = *result.mutable_metadata();
  metadata["interceptor"].set_string_value("email-redactor");
  metadata["redacted"].set_bool_value(changed);
  return result;
}

ichain::Findings validate_no_emails(InvokeInterceptorRequest const& request) {
  ichain::Findings findings;
  if (!request.has_payload()) return findings;

  for (auto&& address : find_addresses(ichain::to_json(request.payload()))) {
    ichain::msgs::ValidationResult finding;
    finding.set_severity(ichain::msgs::WARNING);
    finding.set_message(fmt::format("Found potentially unredacted email: {}", address));
    finding.set_path("$.payload");
    findings.push_back(finding);
  }
  return findings;
}

InvokeInterceptorResult log_request(InvokeInterceptorRequest const& request,
                                    std::shared_ptr<spdlog::logger> const& log) {
  auto target = log != nullptr ? log : ichain::logger();
  target->info("Interceptor invoked for event: {}, phase: {}", request.event(),
               ichain::msgs::InterceptorPhase_Name(request.phase()));

  InvokeInterceptorResult result;
  auto& metadata = *result.mutable_metadata();
  metadata["interceptor"].set_string_value("request-logger");
  metadata["timestamp"].set_string_value(ichain::pb::TimeUtil::ToString(ichain::current_time()));
  return result;
}

}  // namespace

std::string redact(std::string const& text, bool* changed) {
  auto redacted = std::regex_replace(text, address_pattern(), "[REDACTED_EMAIL]");
  if (changed != nullptr) *changed = redacted != text;
  return redacted;
}

std::vector<std::string> find_addresses(std::string const& text) {
  std::vector<std::string> addresses;
  auto first = std::sregex_iterator(text.begin(), text.end(), address_pattern());
  for (auto it = first; it != std::sregex_iterator(); ++it) addresses.push_back(it->str());
  return addresses;
}

ichain::Interceptor redactor() {
  ichain::CreateOptions options;
  options.id = "email-redactor";
  options.name = "Email Redaction Interceptor";
  options.description =
      "Redacts email addresses from request and response payloads by replacing them with "
      "[REDACTED_EMAIL].";
  options.type = InterceptorType::MUTATION;
  options.priority = 10;
  return ichain::make_interceptor(options, {ichain::arg("request")}, &redact_emails);
}

ichain::Interceptor leak_validator() {
  ichain::CreateOptions options;
  options.id = "email-validator";
  options.name = "Email Leak Validator";
  options.description = "Validates that response payloads don't contain unredacted email addresses.";
  options.type = InterceptorType::VALIDATION;
  options.priority = 5;
  options.phases = {InterceptorPhase::RESPONSE};
  return ichain::make_interceptor(options, {ichain::arg("request")}, &validate_no_emails);
}

ichain::Interceptor request_logger() {
  ichain::CreateOptions options;
  options.id = "request-logger";
  options.name = "Request Logger";
  options.description = "Logs when interceptors are invoked for observability.";
  options.type = InterceptorType::OBSERVABILITY;
  options.priority = 1;
  return ichain::make_interceptor(
      options, {ichain::arg("request"), ichain::optional_service("logger")}, &log_request);
}

std::vector<ichain::Interceptor> interceptors() {
  return {redactor(), leak_validator(), request_logger()};
}

}  // namespace email
