#pragma once

#include <canon/schema/events.hpp>

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace canon::execution {

using event_subscriber_t =
    std::function<void(const canon::schema::event_record_t& record)>;
using subscription_id_t = uint64_t;

/// Append-only event sequence for one component.
///
/// Events are staged while a block executes and become committed, durable
/// and visible to subscribers on commit. Sequence numbers are assigned on
/// append and never reused.
class event_log final {
 public:
  const canon::schema::event_record_t& append(uint64_t height,
                                               canon::schema::event_t event);

  /// Move staged events to the committed set and return them.
  std::vector<canon::schema::event_record_t> take_pending();

  subscription_id_t subscribe(event_subscriber_t subscriber);
  /// Takes effect from the next publish. Unknown ids are ignored.
  void unsubscribe(subscription_id_t id);
  void publish(const std::vector<canon::schema::event_record_t>& records) const;

  const std::vector<canon::schema::event_record_t>& pending() const;
  uint64_t next_sequence() const;
  void restore_sequence(uint64_t next_sequence);

 private:
  std::vector<canon::schema::event_record_t> pending_;
  std::vector<std::pair<subscription_id_t, event_subscriber_t>> subscribers_;
  subscription_id_t next_subscription_{1};
  uint64_t next_sequence_{1};
};

}  // namespace canon::execution
