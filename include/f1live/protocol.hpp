#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <f1live/snap.hpp>

namespace f1live {

// {"type":"track","data":{"points":[[x,y],...],"total_length":L}}
struct TrackMessage {
  TrackPayload track;
};

// Flat object carrying "time", "cars", "weather", ...
struct StateMessage {
  RaceSnapshot snapshot;
};

using InboundMessage = std::variant<TrackMessage, StateMessage>;

// Decodes one inbound text frame. Malformed or unrecognised payloads yield
// nullopt; wrongly typed optional fields fall back to their defaults.
std::optional<InboundMessage> decode_message(std::string_view text);

// Body of GET /api/track: {"points":[...],"total_length":L}
std::optional<TrackPayload> decode_track_body(std::string_view text);

// Acknowledgement / status body of the HTTP control endpoints. Only fields
// that are present and well typed are set.
struct ControlAck {
  std::optional<bool> paused;
  std::optional<double> speed_multiplier;
  std::optional<bool> race_started;
  std::optional<bool> race_finished;
  std::optional<double> time;
};

std::optional<ControlAck> decode_control_ack(std::string_view text);

// Client -> server control frame.
std::string encode_reset();

// Bodies for the HTTP control endpoints.
std::string encode_start_request(const Weather& w);
std::string encode_speed_request(double speed);

} // namespace f1live
