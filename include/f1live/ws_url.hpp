#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace f1live {

struct WsUrl {
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};
  bool secure{false};
};

// ws://host[:port][/path]; wss:// parses with secure=true and port 443.
std::optional<WsUrl> parse_ws_url(std::string_view url);

// ws://h:p/ws -> http://h:p ; wss -> https
std::string http_base_from_ws_url(std::string_view url);

} // namespace f1live
