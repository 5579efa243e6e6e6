#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

#include "internal/runtime/event_filter.hpp"
#include "internal/runtime/runtime.hpp"
#include "internal/util/time.hpp"

namespace berth::runtime {

struct EventReadPlan {
  EventFilter                    filter;
  std::optional<util::TimePoint> since;
  std::optional<util::TimePoint> until;
  bool                           stream     = false;
  bool                           from_start = false;
};

/*
  Bounded in-memory event journal with blocking readers.

  Sequence numbers are monotonic; once the journal is full the oldest
  entry is dropped and lagging readers skip ahead. After Close() no
  further events are accepted and streaming readers end with kClosed
  once they have drained what is left.
*/
class EventBus {
 public:
  explicit EventBus(std::size_t capacity = 4096);

  // Stamps the event time when unset. Ignored after Close().
  void Publish(engine::v1::Event event);

  void Close();

  bool Closed() const;

  std::size_t Size() const;

  /*
    A streaming read without since/from_start starts at the journal end;
    every other read starts at the oldest retained event. The sink runs
    without the journal lock held.
  */
  EventStreamEnd Read(const EventReadPlan& plan, const EventSink& sink, std::stop_token stop);

 private:
  const std::size_t capacity_;

  mutable std::mutex               mutex_;
  std::condition_variable_any      cv_;
  std::deque<engine::v1::Event>    journal_;
  uint64_t                         first_seq_ = 0;
  uint64_t                         next_seq_  = 0;
  bool                             closed_    = false;
};

} // namespace berth::runtime
