#pragma once

#include <ichain/msgs/interceptor.pb.h>
#include <stdexcept>
#include <string>

namespace ichain {

using msgs::Status;
using msgs::StatusCode;

// Base of every failure raised by the engine. Carries the status code reported to clients and,
// when the failure belongs to a specific interceptor, its id.
class Error : public std::runtime_error {
  StatusCode error_code;
  std::string id;

 public:
  Error(StatusCode code, std::string const& what, std::string const& interceptor_id = "");

  StatusCode code() const { return error_code; }
  std::string const& interceptor_id() const { return id; }

  Status status() const;
};

// Raised after a chain finished executing when its mutation group was aborted. The validation and
// observability groups have already run, the partial result keeps everything they produced.
class ChainError : public Error {
  msgs::ExecuteChainResult partial_result;

 public:
  ChainError(Error const& cause, msgs::ExecuteChainResult partial);

  msgs::ExecuteChainResult const& partial() const { return partial_result; }
};

Error duplicate_id(std::string const& id);
Error unknown_interceptor_id(std::string const& id);
Error missing_required_parameter(std::string const& id, std::string const& parameter);

// Converts any exception escaping an interceptor into an Error attributed to it. Errors raised
// by the engine itself keep their code.
Error handler_failure(std::string const& id, std::exception const& e);
// Same for anything thrown that isn't an std::exception
Error handler_failure(std::string const& id);

}  // namespace ichain
