#include <catch2/catch.hpp>
#include "../rpctrace/cli.hpp"

using namespace rpctrace;

TEST_CASE("Environment variables map to option names", "[cli]") {
  SECTION("prefixed variables are lower cased with dashes") {
    REQUIRE(environment_option_name("RPCTRACE_ZIPKIN_HOST") == "zipkin-host");
    REQUIRE(environment_option_name("RPCTRACE_LOGLEVEL") == "loglevel");
  }

  SECTION("other variables are ignored") {
    REQUIRE(environment_option_name("PATH").empty());
    REQUIRE(environment_option_name("ZIPKIN_HOST").empty());
    REQUIRE(environment_option_name("RPCTRAC").empty());
  }

  SECTION("bytes outside ASCII are kept as they are") {
    std::string variable = "RPCTRACE_HOST_\xC3\x89";
    REQUIRE(environment_option_name(variable) == "host-\xC3\x89");
  }
}

TEST_CASE("Common options come before the user ones", "[cli]") {
  po::options_description user("Echo");
  user.add_options()("zipkin-host", po::value<std::string>(), "zipkin host");

  auto description = common_options(user);
  REQUIRE(description.find_nothrow("help", false) != nullptr);
  REQUIRE(description.find_nothrow("loglevel", false) != nullptr);
  REQUIRE(description.find_nothrow("zipkin-host", false) != nullptr);

  char program[] = "rpctrace-tests";
  char option[] = "--zipkin-host=collector";
  char* argv[] = {program, option};
  po::variables_map vm;
  po::store(po::parse_command_line(2, argv, description), vm);
  po::notify(vm);
  REQUIRE(vm["zipkin-host"].as<std::string>() == "collector");
  REQUIRE(vm["loglevel"].as<char>() == 'i');
}
