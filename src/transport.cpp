#include <f1live/transport.hpp>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace f1live {

TransportChannel::TransportChannel(ConnectionFactory factory, ReconnectPolicy policy)
  : factory_(std::move(factory)), policy_(policy) {}

void TransportChannel::start(Clock::time_point now) {
  if (state_ != State::Idle) return;
  begin_attempt_(now);
}

void TransportChannel::stop() {
  conn_.reset();
  state_ = State::Idle;
}

void TransportChannel::begin_attempt_(Clock::time_point now) {
  conn_ = factory_ ? factory_() : nullptr;
  if (!conn_) {
    last_error_ = "no connection available";
    schedule_retry_(now, policy_.on_attempt_failed());
    return;
  }
  state_ = State::Connecting;
  // a connection may fail synchronously (resolve error, bad scheme)
  poll(now);
}

void TransportChannel::schedule_retry_(Clock::time_point now, ReconnectPolicy::Millis delay) {
  conn_.reset();
  state_ = State::Backoff;
  next_attempt_ = now + delay;
  spdlog::warn("transport: {} (retry in {} ms)", last_error_, delay.count());
}

void TransportChannel::poll(Clock::time_point now) {
  switch (state_) {
    case State::Idle:
      return;

    case State::Backoff:
      if (now >= next_attempt_) begin_attempt_(now);
      return;

    case State::Connecting:
      switch (conn_->poll_connect()) {
        case ConnectStatus::Pending:
          return;
        case ConnectStatus::Open:
          state_ = State::Open;
          policy_.on_connected();
          spdlog::info("transport: connected");
          break;  // fall through to reading: data may follow the handshake
        case ConnectStatus::Failed:
          last_error_ = conn_->error();
          schedule_retry_(now, policy_.on_attempt_failed());
          return;
      }
      [[fallthrough]];

    case State::Open: {
      inbox_.clear();
      const bool alive = conn_->read_messages(inbox_);
      dispatch_(inbox_);
      // a handler may have stopped the channel
      if (state_ != State::Open) return;
      if (!alive) {
        last_error_ = conn_->error();
        schedule_retry_(now, policy_.on_connection_lost());
      }
      return;
    }
  }
}

bool TransportChannel::send(std::string_view message) {
  if (state_ != State::Open || !conn_) return false;
  if (conn_->send_text(message)) return true;
  // the next poll() notices the broken connection and schedules a retry
  spdlog::debug("transport: send failed: {}", conn_->error());
  return false;
}

std::size_t TransportChannel::subscribe(MessageHandler handler) {
  const std::size_t id = next_sub_id_++;
  subscribers_.push_back({id, std::move(handler)});
  return id;
}

void TransportChannel::unsubscribe(std::size_t id) {
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const Subscriber& s) { return s.id == id; }),
                     subscribers_.end());
}

void TransportChannel::dispatch_(const std::vector<std::string>& batch) {
  for (const auto& msg : batch) {
    // indexed: a handler may subscribe while we iterate
    for (std::size_t i = 0; i < subscribers_.size(); ++i) {
      if (subscribers_[i].fn) subscribers_[i].fn(msg);
    }
  }
}

} // namespace f1live
