#include <f1live/ws_url.hpp>
#include <charconv>
#include <system_error>

namespace f1live {

std::optional<WsUrl> parse_ws_url(std::string_view url) {
  WsUrl out;
  if (url.starts_with("ws://")) {
    url.remove_prefix(5);
  } else if (url.starts_with("wss://")) {
    url.remove_prefix(6);
    out.secure = true;
    out.port = 443;
  } else {
    return std::nullopt;
  }

  const auto slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  if (slash != std::string_view::npos) out.path = std::string(url.substr(slash));

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    std::string_view port_str = authority.substr(colon + 1);
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535) {
      return std::nullopt;
    }
    out.port = static_cast<std::uint16_t>(value);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) return std::nullopt;
  out.host = std::string(authority);
  return out;
}

std::string http_base_from_ws_url(std::string_view url) {
  std::string s(url);
  if (s.starts_with("wss://")) s = "https://" + s.substr(6);
  else if (s.starts_with("ws://")) s = "http://" + s.substr(5);
  if (s.ends_with("/ws")) s.resize(s.size() - 3);
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

} // namespace f1live
