#pragma once

#include <memory>
#include <string>
#include "cancellation.hpp"
#include "progress.hpp"
#include "service-resolver.hpp"

namespace ichain {

// Identifies the server and the client session a call arrived on.
struct ServerHandle {
  std::string server_id;
  std::string session_id;
};

// Ambient state of one invoke or chain call. Interceptors can receive any of these values as
// arguments, see ParameterBinder.
class Context {
  std::string call_id;
  CancellationToken cancellation;
  std::shared_ptr<ServiceResolver> resolver;
  ServerHandle handle;
  ProgressSink sink;

 public:
  Context() = default;
  explicit Context(std::string const& id) : call_id(id) {}

  std::string const& id() const { return call_id; }
  CancellationToken const& token() const { return cancellation; }
  std::shared_ptr<ServiceResolver> const& services() const { return resolver; }
  ServerHandle const& server() const { return handle; }
  ProgressSink const& progress_sink() const { return sink; }

  Context& with_token(CancellationToken const& token) {
    cancellation = token;
    return *this;
  }

  Context& with_services(std::shared_ptr<ServiceResolver> const& services) {
    resolver = services;
    return *this;
  }

  Context& with_server(ServerHandle const& server) {
    handle = server;
    return *this;
  }

  Context& with_progress(ProgressSink const& progress) {
    sink = progress;
    return *this;
  }

  bool cancelled() const { return cancellation.cancelled(); }

  ProgressEmitter progress(std::string const& progress_token) const {
    return ProgressEmitter(progress_token, sink);
  }
};

}  // namespace ichain
