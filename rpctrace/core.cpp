#include "core.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace rpctrace {

std::string make_random_uid() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

std::string hostname() {
  return boost::asio::ip::host_name();
}

SystemTime current_time() {
  return std::chrono::system_clock::now();
}

std::string to_json(Status const& status) {
  std::string packed;
  pb::MessageToJsonString(status, &packed);
  return packed;
}

}  // namespace rpctrace
