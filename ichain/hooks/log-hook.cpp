#include "log-hook.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include "../core.hpp"

namespace ichain {

LogHook::LogHook(char level) {
  logger = spdlog::get("log-hook");
  if (!logger) {
    logger = spdlog::stdout_color_mt("log-hook");
    logger->set_pattern("[%L][%t][%d-%m-%Y %H:%M:%S:%e] %v");
  }
  if (level == 'd')
    logger->set_level(spdlog::level::debug);
  else if (level == 'i')
    logger->set_level(spdlog::level::info);
  else if (level == 'w')
    logger->set_level(spdlog::level::warn);
  else if (level == 'e')
    logger->set_level(spdlog::level::err);
}

void LogHook::before_invoke(InvocationContext* context) {
  logger->debug("{};{};{};started", context->descriptor->id(), context->event,
                msgs::InterceptorPhase_Name(context->phase));
}

void LogHook::after_invoke(InvocationContext* context) {
  auto took = pb::TimeUtil::DurationToMilliseconds(current_time() - context->started_at);
  auto code = msgs::StatusCode_Name(context->status.code());
  auto id = context->descriptor->id();
  auto phase = msgs::InterceptorPhase_Name(context->phase);

  if (context->status.code() == StatusCode::OK) {
    logger->info("{};{};{};{}ms;{}", id, context->event, phase, took, code);
  } else if (context->status.code() == StatusCode::HANDLER_FAILURE ||
             context->status.code() == StatusCode::INTERNAL_ERROR) {
    logger->error("{};{};{};{}ms;{};'{}'", id, context->event, phase, took, code,
                  context->status.why());
  } else {
    logger->warn("{};{};{};{}ms;{};'{}'", id, context->event, phase, took, code,
                 context->status.why());
  }
}

}  // namespace ichain
