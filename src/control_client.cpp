#include <f1live/control_client.hpp>
#include <chrono>
#include <iterator>

#include <spdlog/spdlog.h>

namespace f1live {

const char* control_kind_name(ControlKind k) {
  switch (k) {
    case ControlKind::Start:  return "start";
    case ControlKind::Pause:  return "pause";
    case ControlKind::Resume: return "resume";
    case ControlKind::Speed:  return "speed";
    case ControlKind::Status: return "status";
  }
  return "?";
}

ControlClient::ControlClient(std::string http_base, long timeout_s)
  : ControlClient(std::move(http_base),
                  [timeout_s](Method m, const std::string& url, const std::string& body) {
                    return m == Method::Get ? http_get(url, timeout_s)
                                            : http_post_json(url, body, timeout_s);
                  }) {}

ControlClient::ControlClient(std::string http_base, Requester requester)
  : base_(std::move(http_base)), requester_(std::move(requester)) {}

void ControlClient::start_race(const Weather& w) {
  submit_(ControlKind::Start, Method::Post, "/api/start", encode_start_request(w));
}

void ControlClient::pause() {
  submit_(ControlKind::Pause, Method::Post, "/api/simulation/pause", "{}");
}

void ControlClient::resume() {
  submit_(ControlKind::Resume, Method::Post, "/api/simulation/resume", "{}");
}

void ControlClient::set_speed(double multiplier) {
  submit_(ControlKind::Speed, Method::Post, "/api/simulation/speed", encode_speed_request(multiplier));
  pending_.back().requested_speed = multiplier;
}

void ControlClient::request_status() {
  submit_(ControlKind::Status, Method::Get, "/api/race-status", {});
}

void ControlClient::submit_(ControlKind kind, Method m, const std::string& path, std::string body) {
  spdlog::debug("control: {} request", control_kind_name(kind));
  pending_.push_back({kind, std::async(std::launch::async, requester_, m, base_ + path, std::move(body)), 0.0});
}

std::vector<ControlResult> ControlClient::poll() {
  std::vector<ControlResult> done;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    const HttpResponse res = it->result.get();
    ControlResult r;
    r.kind = it->kind;
    const double requested = it->requested_speed;
    r.ok = res.ok;
    r.error = res.error;
    if (res.ok) r.ack = decode_control_ack(res.body);
    it = pending_.erase(it);

    if (!r.ok) {
      spdlog::warn("control: {} failed: {}", control_kind_name(r.kind), r.error);
    } else {
      switch (r.kind) {
        case ControlKind::Pause:  paused_ = true;  break;
        case ControlKind::Resume: paused_ = false; break;
        case ControlKind::Start:  paused_ = false; speed_ = 1.0; break;
        case ControlKind::Speed:  speed_ = requested; break;
        default: break;
      }
      if (r.ack) {
        if (r.ack->paused) paused_ = *r.ack->paused;
        if (r.ack->speed_multiplier) speed_ = *r.ack->speed_multiplier;
      }
    }
    done.push_back(std::move(r));
  }
  return done;
}

double ControlClient::faster_step() const {
  for (double s : kSpeedSteps) if (s > speed_ + 1e-9) return s;
  return kSpeedSteps[std::size(kSpeedSteps) - 1];
}

double ControlClient::slower_step() const {
  double best = kSpeedSteps[0];
  for (double s : kSpeedSteps) if (s < speed_ - 1e-9) best = s;
  return best;
}

} // namespace f1live
