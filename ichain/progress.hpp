#pragma once

#include <ichain/msgs/interceptor.pb.h>
#include <functional>
#include <string>

namespace ichain {

using ProgressSink = std::function<void(msgs::ProgressNotification const&)>;

// Relays progress reports of an interceptor back to whoever invoked it. Without a progress token
// or a sink every report is dropped.
class ProgressEmitter {
  std::string token;
  ProgressSink sink;

 public:
  ProgressEmitter() = default;
  ProgressEmitter(std::string const& progress_token, ProgressSink const& progress_sink);

  bool enabled() const { return !token.empty() && sink; }
  std::string const& progress_token() const { return token; }

  void report(double progress, double total = 0.0, std::string const& message = "") const;
};

}  // namespace ichain
