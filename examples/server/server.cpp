#include <ichain/cli.hpp>
#include <ichain/engine.hpp>
#include <ichain/hooks/log-hook.hpp>
#include <ichain/rpc/interceptor-server.hpp>
#include <ichain/rpc/metrics-hook.hpp>
#include <prometheus/exposer.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <csignal>
#include <thread>
#include "../interceptors/email-interceptors.hpp"

int main(int argc, char** argv) {
  std::string uri, name, metrics;

  ichain::po::options_description opts("Server");
  auto opt_add = opts.add_options();
  opt_add("uri,u", ichain::po::value<std::string>(&uri)->required(), "amqp broker uri");
  opt_add("name,n", ichain::po::value<std::string>(&name)->default_value("Interceptors"),
          "queue the interceptors are served on");
  opt_add("metrics,m", ichain::po::value<std::string>(&metrics)->default_value("0.0.0.0:8080"),
          "address where prometheus metrics are exposed");
  auto vm = ichain::parse_program_options(argc, argv, opts);

  ichain::Engine engine(ichain::engine_options(vm));

  prometheus::Exposer exposer(metrics);
  auto registry = std::make_shared<prometheus::Registry>();
  exposer.RegisterCollectable(registry);
  engine.get_invoker().add_hook<ichain::LogHook>();
  engine.get_invoker().add_hook<ichain::rpc::MetricsHook>(registry);

  for (auto&& interceptor : email::interceptors()) engine.add(interceptor);

  auto services = std::make_shared<ichain::ServiceCollection>();
  services->add(ichain::logger());

  ichain::rpc::InterceptorServer server(engine, uri, name);
  server.set_services(services);

  // Stops serving on SIGINT/SIGTERM, detached tasks are drained afterwards
  std::atomic<bool> running{true};
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([&](boost::system::error_code const& error, int signal) {
    if (!error) ichain::info("Received signal {}, shutting down", signal);
    running = false;
  });
  std::thread signal_thread([&] { signals_context.run(); });

  server.run([&] { return running.load(); });

  signals.cancel();
  signal_thread.join();
  auto lost = engine.shutdown();
  if (lost > 0) ichain::warn("{} detached task(s) didn't finish in time", lost);
  return 0;
}
