#pragma once
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <f1live/http_client.hpp>
#include <f1live/protocol.hpp>
#include <f1live/snap.hpp>

namespace f1live {

enum class ControlKind { Start, Pause, Resume, Speed, Status };

const char* control_kind_name(ControlKind k);

struct ControlResult {
  ControlKind kind{ControlKind::Status};
  bool ok{false};
  std::string error;
  std::optional<ControlAck> ack;   // parsed body when it was JSON
};

// Fire-and-forget HTTP control requests (start race, pause/resume, speed,
// status). Results are collected by poll() from the render loop; only the
// HTTP status decides success.
class ControlClient {
public:
  enum class Method { Get, Post };
  using Requester = std::function<HttpResponse(Method, const std::string& url, const std::string& body)>;

  static constexpr double kSpeedSteps[] = {0.5, 1.0, 2.0, 5.0};

  ControlClient(std::string http_base, long timeout_s);
  // requester must be callable; tests inject a fake.
  ControlClient(std::string http_base, Requester requester);

  void start_race(const Weather& w);
  void pause();
  void resume();
  void set_speed(double multiplier);
  void request_status();

  // Completed requests since the last call, in completion order.
  std::vector<ControlResult> poll();

  std::size_t in_flight() const { return pending_.size(); }

  // Last acknowledged server state.
  bool paused() const { return paused_; }
  double speed() const { return speed_; }

  // Next/previous entry of kSpeedSteps relative to the current speed.
  double faster_step() const;
  double slower_step() const;

private:
  void submit_(ControlKind kind, Method m, const std::string& path, std::string body);

  std::string base_;
  Requester requester_;

  struct Pending {
    ControlKind kind;
    std::future<HttpResponse> result;
    double requested_speed;
  };
  std::vector<Pending> pending_;

  bool paused_{false};
  double speed_{1.0};
};

} // namespace f1live
