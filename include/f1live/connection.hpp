#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace f1live {

enum class ConnectStatus { Pending, Open, Failed };

// One full-duplex text connection. All calls are non-blocking and meant to be
// polled from the render loop.
class Connection {
public:
  virtual ~Connection() = default;

  // Drives connect + handshake; Open once messages can flow.
  virtual ConnectStatus poll_connect() = 0;

  // false when the frame could not be queued (not open, socket error).
  virtual bool send_text(std::string_view text) = 0;

  // Appends every complete inbound text message; false once the peer closed
  // or the connection failed (messages read before that are still appended).
  virtual bool read_messages(std::vector<std::string>& out) = 0;

  virtual const std::string& error() const = 0;

  // libcurl WebSocket client (ws:// and wss://). Resolve, connect, TLS and
  // the upgrade run on a worker thread; poll_connect() picks up the result.
  static std::unique_ptr<Connection> create_websocket(const std::string& url, long connect_timeout_s);
};

} // namespace f1live
