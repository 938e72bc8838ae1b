#include <canon/execution/event_log.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>
#include <utility>

namespace canon::execution {

const canon::schema::event_record_t& event_log::append(
    const uint64_t height,
    canon::schema::event_t event) {
  auto record = canon::schema::event_record_t{};
  record.sequence = next_sequence_++;
  record.height = height;
  record.event = std::move(event);
  pending_.push_back(std::move(record));
  return pending_.back();
}

std::vector<canon::schema::event_record_t> event_log::take_pending() {
  auto out = std::vector<canon::schema::event_record_t>{};
  out.swap(pending_);
  return out;
}

subscription_id_t event_log::subscribe(event_subscriber_t subscriber) {
  auto id = next_subscription_++;
  subscribers_.emplace_back(id, std::move(subscriber));
  return id;
}

void event_log::unsubscribe(const subscription_id_t id) {
  std::erase_if(subscribers_,
                [id](const auto& entry) { return entry.first == id; });
}

void event_log::publish(
    const std::vector<canon::schema::event_record_t>& records) const {
  // Subscribers may subscribe again while being notified.
  auto subscribers = subscribers_;
  for (const auto& record : records) {
    for (const auto& [id, subscriber] : subscribers) {
      try {
        subscriber(record);
      } catch (const std::exception& ex) {
        spdlog::error("Event subscriber failed on event {}: {}",
                      record.sequence, ex.what());
      }
    }
  }
}

const std::vector<canon::schema::event_record_t>& event_log::pending() const {
  return pending_;
}

uint64_t event_log::next_sequence() const {
  return next_sequence_;
}

void event_log::restore_sequence(const uint64_t next_sequence) {
  next_sequence_ = next_sequence;
}

}  // namespace canon::execution
