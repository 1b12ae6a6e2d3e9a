#pragma once

#include <spdlog/spdlog.h>
#include "../hook.hpp"

namespace ichain {

// Logs one line per invocation: id;event;phase;duration;code and the failure reason if any.
class LogHook : public ExecutionHook {
  std::shared_ptr<spdlog::logger> logger;

 public:
  LogHook(char level = 'i');
  void before_invoke(InvocationContext* context) override;
  void after_invoke(InvocationContext* context) override;
};  // LogHook

}  // namespace ichain
