#include "event_subscription.hpp"

#include <chrono>
#include <exception>

namespace berth::engine {

EventSubscription::EventSubscription(Engine& engine, v1::EventsOptions options, EventSink sink)
    : result_(done_.get_future().share()),
      thread_([this, &engine, options = std::move(options), sink = std::move(sink)](std::stop_token stop) {
        try {
          engine.Events(options, sink, stop);
          done_.set_value();
        } catch (...) {
          done_.set_exception(std::current_exception());
        }
      }) {
}

void EventSubscription::Stop() {
  thread_.request_stop();
}

void EventSubscription::Wait() {
  result_.get();
}

bool EventSubscription::Done() const {
  return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace berth::engine
