#pragma once

#include <future>
#include <thread>

#include "internal/engine/engine.hpp"

namespace berth::engine {

/*
  Runs Engine::Events on its own thread.

  Destruction requests stop and joins. Wait() returns once the read has
  ended and rethrows what it ended with (util::StreamClosed, transport
  errors, ...).
*/
class EventSubscription {
 public:
  EventSubscription(Engine& engine, v1::EventsOptions options, EventSink sink);
  ~EventSubscription() = default;

  EventSubscription(const EventSubscription&)            = delete;
  EventSubscription& operator=(const EventSubscription&) = delete;

  void Stop();

  void Wait();

  // true once the read has ended, without blocking.
  bool Done() const;

 private:
  std::promise<void>       done_;
  std::shared_future<void> result_;
  std::jthread             thread_;
};

} // namespace berth::engine
