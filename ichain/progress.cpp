#include "progress.hpp"
#include "logger.hpp"

namespace ichain {

ProgressEmitter::ProgressEmitter(std::string const& progress_token, ProgressSink const& progress_sink)
    : token(progress_token), sink(progress_sink) {}

void ProgressEmitter::report(double progress, double total, std::string const& message) const {
  if (!enabled()) return;

  msgs::ProgressNotification notification;
  notification.set_progress_token(token);
  notification.set_progress(progress);
  notification.set_total(total);
  notification.set_message(message);
  try {
    sink(notification);
  } catch (std::exception const& e) {
    // sink failures never reach the interceptor
    warn("Failed to relay progress for token '{}': {}", token, e.what());
  }
}

}  // namespace ichain
