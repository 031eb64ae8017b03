#include "cli.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include "logger.hpp"

namespace rpctrace {

namespace {

const std::string kEnvironmentPrefix = "RPCTRACE_";

[[noreturn]] void exit_with_help(po::options_description const& description,
                                 std::string const& message = "") {
  std::cout << message << '\n' << description << std::endl;
  std::exit(0);
}

}  // namespace

std::string environment_option_name(std::string const& variable) {
  if (variable.compare(0, kEnvironmentPrefix.size(), kEnvironmentPrefix) != 0) return "";

  auto name = variable.substr(kEnvironmentPrefix.size());
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) -> char {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });
  return name;
}

po::options_description common_options(po::options_description const& user_options) {
  po::options_description description("Common");
  description.add_options()("help", "show available options")(
      "loglevel", po::value<char>()->default_value('i'),
      "char indicating the desired log level: d[ebug], i[nfo], w[warn], e[error]");
  description.add(user_options);
  return description;
}

po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options) {
  auto description = common_options(user_options);
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description, environment_option_name), vm);
    po::notify(vm);
  } catch (std::exception const& e) {
    exit_with_help(description, fmt::format("Error parsing program options: {}", e.what()));
  }

  if (vm.count("help")) exit_with_help(description);

  auto level = vm["loglevel"].as<char>();
  if (set_loglevel(level) != 0)
    exit_with_help(description, fmt::format("Invalid log level '{}'", level));

  return vm;
}

}  // namespace rpctrace
