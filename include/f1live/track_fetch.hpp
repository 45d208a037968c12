#pragma once
#include <functional>
#include <future>
#include <optional>
#include <string>

#include <f1live/snap.hpp>

namespace f1live {

// One-shot side-channel retrieval of the static track, used when the stream
// never delivered a track payload. Runs the fetch on a worker via std::async
// and is polled from the render loop.
class TrackFetcher {
public:
  using FetchFn = std::function<std::optional<TrackPayload>()>;

  enum class State { Idle, InFlight, Done, Failed };

  explicit TrackFetcher(FetchFn fn) : fn_(std::move(fn)) {}

  // GET <http_base>/api/track
  static FetchFn http(std::string http_base, long timeout_s);

  // Starts the fetch unless it already ran; a fetcher only ever fires once.
  void start();

  // Returns the payload exactly once, when the fetch has succeeded.
  std::optional<TrackPayload> poll();

  State state() const { return state_; }

private:
  FetchFn fn_;
  State state_{State::Idle};
  std::future<std::optional<TrackPayload>> pending_;
};

} // namespace f1live
