#pragma once

#include <map>
#include <string>
#include <vector>

#include "berth/engine/v1/types.pb.h"

namespace berth::runtime {

/*
  Event filter set built from "key=value" expressions.

  Values given for the same key are alternatives; different keys must
  all match. Keys: type, event, container, image, network, label.
  A label value is either "k" (presence) or "k=v".
*/
class EventFilter {
 public:
  EventFilter() = default;

  // Throws util::Internal on a malformed expression or unknown key.
  static EventFilter Parse(const std::vector<std::string>& expressions);

  bool Matches(const engine::v1::Event& event) const;

  bool Empty() const {
    return by_key_.empty();
  }

 private:
  std::map<std::string, std::vector<std::string>> by_key_;
};

} // namespace berth::runtime
