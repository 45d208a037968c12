#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace f1live {

// Named, time-bounded cosmetic effects (lap banner flash, selection pulse).
// Purely presentational: cancelling or dropping an effect never touches race
// state.
class EffectScheduler {
public:
  using Clock = std::chrono::steady_clock;
  using Id = std::uint64_t;

  // Starts after `delay`, runs for `duration`. Scheduling a name that is
  // already running restarts it.
  Id schedule(const std::string& name, Clock::time_point now,
              Clock::duration duration, Clock::duration delay = Clock::duration::zero()) {
    cancel(name);
    const Id id = next_id_++;
    tasks_.push_back({id, name, now + delay, duration});
    return id;
  }

  bool cancel(Id id) {
    const auto before = tasks_.size();
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [id](const Task& t) { return t.id == id; }),
                 tasks_.end());
    return tasks_.size() != before;
  }

  void cancel(const std::string& name) {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [&](const Task& t) { return t.name == name; }),
                 tasks_.end());
  }

  void cancel_all() { tasks_.clear(); }

  // Drops finished effects.
  void expire(Clock::time_point now) {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [now](const Task& t) { return now >= t.start + t.duration; }),
                 tasks_.end());
  }

  // Progress in [0,1) of a running effect; nullopt when it is pending,
  // finished or unknown.
  std::optional<double> progress(const std::string& name, Clock::time_point now) const {
    for (const auto& t : tasks_) {
      if (t.name != name || now < t.start) continue;
      const auto elapsed = now - t.start;
      if (elapsed >= t.duration) return std::nullopt;
      return std::chrono::duration<double>(elapsed).count() /
             std::chrono::duration<double>(t.duration).count();
    }
    return std::nullopt;
  }

  bool active(const std::string& name, Clock::time_point now) const { return progress(name, now).has_value(); }
  std::size_t size() const { return tasks_.size(); }

private:
  struct Task {
    Id id;
    std::string name;
    Clock::time_point start;
    Clock::duration duration;
  };

  std::vector<Task> tasks_;
  Id next_id_{1};
};

} // namespace f1live
