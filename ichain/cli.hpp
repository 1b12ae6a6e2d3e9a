#pragma once

#include <ichain/msgs/interceptor.pb.h>
#include <boost/program_options.hpp>

namespace ichain {

namespace po = boost::program_options;

// Parses the command line merged with ICHAIN_* environment variables (ICHAIN_WORKER_THREADS maps
// to --worker-threads). Adds the common options and applies the requested log level.
po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options = {});

// Engine options from the --config file, with --worker-threads and --drain-timeout-ms on top.
msgs::EngineOptions engine_options(po::variables_map const& vm);

}  // namespace ichain
