#pragma once

#include <boost/program_options.hpp>
#include <string>

namespace rpctrace {

namespace po = boost::program_options;

// Maps an environment variable to the option it configures: RPCTRACE_ZIPKIN_HOST -> zipkin-host.
// Variables without the RPCTRACE_ prefix map to an empty name and are ignored.
std::string environment_option_name(std::string const& variable);

// help and loglevel, followed by the user options
po::options_description common_options(po::options_description const& user_options);

// Parses the command line and the RPCTRACE_* environment variables against the user options plus
// the common ones. Prints the help text and exits when asked for it or when the options are
// invalid. The selected log level is applied before returning.
po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options = {});

}  // namespace rpctrace
