#include "event_bus.hpp"

namespace berth::runtime {

EventBus::EventBus(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void EventBus::Publish(engine::v1::Event event) {
  if (!event.has_time()) {
    *event.mutable_time() = util::ToProto(util::Now());
  }

  {
    std::scoped_lock lock(mutex_);
    if (closed_) {
      return;
    }
    journal_.push_back(std::move(event));
    ++next_seq_;
    while (journal_.size() > capacity_) {
      journal_.pop_front();
      ++first_seq_;
    }
  }
  cv_.notify_all();
}

void EventBus::Close() {
  {
    std::scoped_lock lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventBus::Closed() const {
  std::scoped_lock lock(mutex_);
  return closed_;
}

std::size_t EventBus::Size() const {
  std::scoped_lock lock(mutex_);
  return journal_.size();
}

EventStreamEnd EventBus::Read(const EventReadPlan& plan, const EventSink& sink, std::stop_token stop) {
  std::unique_lock lock(mutex_);

  uint64_t pos = (plan.stream && !plan.from_start && !plan.since) ? next_seq_ : first_seq_;

  for (;;) {
    if (stop.stop_requested()) {
      return EventStreamEnd::kCancelled;
    }
    if (pos < first_seq_) {
      pos = first_seq_;
    }

    if (pos < next_seq_) {
      engine::v1::Event event = journal_[pos - first_seq_];
      ++pos;

      const auto when = util::FromProto(event.time());
      if (plan.until && when > *plan.until) {
        return EventStreamEnd::kUntilReached;
      }
      if ((plan.since && when < *plan.since) || !plan.filter.Matches(event)) {
        continue;
      }

      lock.unlock();
      sink(event);
      lock.lock();
      continue;
    }

    if (!plan.stream) {
      return EventStreamEnd::kDrained;
    }
    if (closed_) {
      return EventStreamEnd::kClosed;
    }

    auto ready = [&] { return pos < next_seq_ || closed_; };
    if (plan.until) {
      if (util::Now() >= *plan.until) {
        return EventStreamEnd::kUntilReached;
      }
      cv_.wait_until(lock, stop, *plan.until, ready);
    } else {
      cv_.wait(lock, stop, ready);
    }
  }
}

} // namespace berth::runtime
