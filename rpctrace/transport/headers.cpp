#include "headers.hpp"
#include <algorithm>
#include <cctype>

namespace rpctrace {
namespace transport {

std::string canonicalize_header_key(std::string const& key) {
  std::string canonical(key);
  std::transform(canonical.begin(), canonical.end(), canonical.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return canonical;
}

Headers::Headers(std::initializer_list<Items::value_type> items) {
  for (auto&& item : items)
    set(item.first, item.second);
}

Headers Headers::from_items(Items const& items) {
  Headers headers;
  for (auto&& item : items)
    headers.set(item.first, item.second);
  return headers;
}

Headers Headers::with(std::string const& key, std::string const& value) const {
  Headers copy(*this);
  copy.set(key, value);
  return copy;
}

void Headers::set(std::string const& key, std::string const& value) {
  entries[canonicalize_header_key(key)] = value;
}

boost::optional<std::string> Headers::get(std::string const& key) const {
  auto it = entries.find(canonicalize_header_key(key));
  if (it == entries.end()) return boost::none;
  return it->second;
}

bool Headers::contains(std::string const& key) const {
  return entries.find(canonicalize_header_key(key)) != entries.end();
}

}  // namespace transport
}  // namespace rpctrace
