#include <f1live/track_fetch.hpp>
#include <chrono>

#include <spdlog/spdlog.h>

#include <f1live/http_client.hpp>
#include <f1live/protocol.hpp>

namespace f1live {

TrackFetcher::FetchFn TrackFetcher::http(std::string http_base, long timeout_s) {
  return [base = std::move(http_base), timeout_s]() -> std::optional<TrackPayload> {
    const HttpResponse res = http_get(base + "/api/track", timeout_s);
    if (!res.ok) {
      spdlog::warn("track fetch: {}", res.error);
      return std::nullopt;
    }
    auto track = decode_track_body(res.body);
    if (!track) spdlog::warn("track fetch: malformed body");
    return track;
  };
}

void TrackFetcher::start() {
  if (state_ != State::Idle) return;
  if (!fn_) { state_ = State::Failed; return; }
  spdlog::debug("track fetch: requesting track over HTTP");
  pending_ = std::async(std::launch::async, fn_);
  state_ = State::InFlight;
}

std::optional<TrackPayload> TrackFetcher::poll() {
  if (state_ != State::InFlight) return std::nullopt;
  if (pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;

  auto result = pending_.get();
  if (!result || result->points.empty()) {
    state_ = State::Failed;
    return std::nullopt;
  }
  state_ = State::Done;
  return result;
}

} // namespace f1live
