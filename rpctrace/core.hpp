#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>
#include <chrono>
#include <string>
#include "errors.hpp"
#include "logger.hpp"

namespace rpctrace {

namespace pb {
using namespace google::protobuf::util;
using namespace google::protobuf;
}  // namespace pb

using SystemTime = std::chrono::system_clock::time_point;

// Returns a unique id
std::string make_random_uid();

// Returns the machine hostname
std::string hostname();

// Wall clock time used to stamp span start times
SystemTime current_time();

// Serializes a status as JSON, the form it takes when carried in a header
std::string to_json(Status const& status);

}  // namespace rpctrace
