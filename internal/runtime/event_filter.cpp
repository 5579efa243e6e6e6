#include "event_filter.hpp"

#include <algorithm>
#include <array>

#include "internal/util/errors.hpp"

namespace berth::runtime {

namespace {

constexpr std::array<const char*, 6> kKeys = {"type", "event", "container", "image", "network", "label"};

bool MatchOne(const std::string& key, const std::string& value, const engine::v1::Event& event) {
  if (key == "type") {
    return event.type() == value;
  }
  if (key == "event") {
    return event.action() == value;
  }
  if (key == "container") {
    return event.type() == "container" && (event.name() == value || event.id().rfind(value, 0) == 0);
  }
  if (key == "image") {
    if (event.image() == value) return true;
    return event.type() == "image" && (event.name() == value || event.id().rfind(value, 0) == 0);
  }
  if (key == "network") {
    return event.type() == "network" && (event.name() == value || event.id() == value);
  }
  if (key == "label") {
    const auto eq = value.find('=');
    const auto it = event.attributes().find(value.substr(0, eq));
    if (it == event.attributes().end()) return false;
    return eq == std::string::npos || it->second == value.substr(eq + 1);
  }
  return false;
}

} // namespace

EventFilter EventFilter::Parse(const std::vector<std::string>& expressions) {
  EventFilter filter;
  for (const auto& expression : expressions) {
    const auto eq = expression.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == expression.size()) {
      throw util::Internal("invalid filter \"" + expression + "\": expected key=value");
    }
    auto key = expression.substr(0, eq);
    if (std::find(kKeys.begin(), kKeys.end(), key) == kKeys.end()) {
      throw util::Internal("\"" + key + "\" is an invalid filter");
    }
    filter.by_key_[key].push_back(expression.substr(eq + 1));
  }
  return filter;
}

bool EventFilter::Matches(const engine::v1::Event& event) const {
  for (const auto& [key, values] : by_key_) {
    const bool any = std::any_of(values.begin(), values.end(), [&](const std::string& value) { return MatchOne(key, value, event); });
    if (!any) return false;
  }
  return true;
}

} // namespace berth::runtime
