#pragma once

#include <boost/optional.hpp>
#include <map>
#include <string>

namespace rpctrace {
namespace transport {

// Headers is an ordered collection of transport headers. Keys are case insensitive and are stored
// in lower case. Values are opaque strings.
class Headers {
 public:
  using Items = std::map<std::string, std::string>;

  Headers() = default;
  Headers(std::initializer_list<Items::value_type> items);

  static Headers from_items(Items const& items);

  // Returns a copy of these headers with the key set to value
  Headers with(std::string const& key, std::string const& value) const;

  // Adds or replaces a key in place
  void set(std::string const& key, std::string const& value);

  boost::optional<std::string> get(std::string const& key) const;
  bool contains(std::string const& key) const;
  std::size_t size() const { return entries.size(); }
  bool empty() const { return entries.empty(); }

  Items const& items() const { return entries; }

  friend bool operator==(Headers const& lhs, Headers const& rhs) {
    return lhs.entries == rhs.entries;
  }

 private:
  Items entries;
};

// Lower cases a header key
std::string canonicalize_header_key(std::string const& key);

}  // namespace transport
}  // namespace rpctrace
