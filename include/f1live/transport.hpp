#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <f1live/connection.hpp>
#include <f1live/reconnect.hpp>

namespace f1live {

// Reconnecting full-duplex text channel. Driven by poll() from the render
// loop; never blocks and never gives up.
class TransportChannel {
public:
  using Clock = std::chrono::steady_clock;
  using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;
  using MessageHandler = std::function<void(std::string_view)>;

  enum class State { Idle, Connecting, Open, Backoff };

  explicit TransportChannel(ConnectionFactory factory, ReconnectPolicy policy = ReconnectPolicy{});

  TransportChannel(const TransportChannel&) = delete;
  TransportChannel& operator=(const TransportChannel&) = delete;

  // First attempt happens immediately.
  void start(Clock::time_point now);
  void stop();

  // Advances connect/handshake, delivers inbound messages to subscribers,
  // and schedules retries.
  void poll(Clock::time_point now);

  // Returns false (never throws) when not connected or the write failed.
  bool send(std::string_view message);

  // Handlers are called in subscription order, from poll().
  std::size_t subscribe(MessageHandler handler);
  void unsubscribe(std::size_t id);

  bool connected() const { return state_ == State::Open; }
  State state() const { return state_; }
  const std::string& last_error() const { return last_error_; }

  // Meaningful in Backoff only.
  Clock::time_point next_attempt_at() const { return next_attempt_; }
  std::uint32_t failed_attempts() const { return policy_.consecutive_failures(); }

private:
  void begin_attempt_(Clock::time_point now);
  void schedule_retry_(Clock::time_point now, ReconnectPolicy::Millis delay);
  void dispatch_(const std::vector<std::string>& batch);

  ConnectionFactory factory_;
  ReconnectPolicy policy_;
  std::unique_ptr<Connection> conn_;
  State state_{State::Idle};
  std::string last_error_;
  Clock::time_point next_attempt_{};

  struct Subscriber { std::size_t id; MessageHandler fn; };
  std::vector<Subscriber> subscribers_;
  std::size_t next_sub_id_{1};
  std::vector<std::string> inbox_;
};

} // namespace f1live
