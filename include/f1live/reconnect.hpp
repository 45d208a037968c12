#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace f1live {

// Exponential backoff: after N consecutive failed attempts the wait before
// the next attempt is min(base * 2^N, cap). A dropped, previously established
// connection counts as N = 0, so the first retry after it waits exactly base.
class ReconnectPolicy {
public:
  using Millis = std::chrono::milliseconds;

  explicit ReconnectPolicy(Millis base = Millis{1000}, Millis cap = Millis{30000})
    : base_(base.count() > 0 ? base : Millis{1}), cap_(cap < base_ ? base_ : cap) {}

  // Wait before the next attempt given the current failure streak.
  Millis next_delay() const {
    Millis d = base_;
    for (std::uint32_t i = 0; i < failures_ && d < cap_; ++i) d *= 2;
    return std::min(d, cap_);
  }

  Millis on_attempt_failed() {
    ++failures_;
    return next_delay();
  }

  Millis on_connection_lost() {
    failures_ = 0;
    return next_delay();
  }

  void on_connected() { failures_ = 0; }

  std::uint32_t consecutive_failures() const { return failures_; }
  Millis base() const { return base_; }
  Millis cap() const { return cap_; }

private:
  Millis base_;
  Millis cap_;
  std::uint32_t failures_{0};
};

} // namespace f1live
