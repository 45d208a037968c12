#include <f1live/connection.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace f1live {

namespace {

constexpr std::size_t kMaxMessage = 16u * 1024u * 1024u;

int abort_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  return static_cast<const std::atomic<bool>*>(clientp)->load() ? 1 : 0;
}

class CurlWsConnection final : public Connection {
public:
  CurlWsConnection(const std::string& url, long connect_timeout_s) : curl_(curl_easy_init()) {
    if (!curl_) {
      error_ = "curl_easy_init failed";
      state_ = State::Failed;
      return;
    }
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    // 2: perform() stops after the WebSocket upgrade
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_s);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_.data());
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_callback);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &abort_);

    CURL* handle = curl_;
    handshake_ = std::async(std::launch::async, [handle]() { return curl_easy_perform(handle); });
  }

  ~CurlWsConnection() override {
    if (handshake_.valid()) {
      // still connecting: the progress callback cancels the transfer
      abort_ = true;
      handshake_.wait();
    } else if (state_ == State::Open) {
      std::size_t sent = 0;
      curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
    }
    if (curl_) curl_easy_cleanup(curl_);
  }

  CurlWsConnection(const CurlWsConnection&) = delete;
  CurlWsConnection& operator=(const CurlWsConnection&) = delete;

  ConnectStatus poll_connect() override {
    if (state_ == State::Failed) return ConnectStatus::Failed;
    if (state_ == State::Open) return ConnectStatus::Open;

    if (handshake_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      return ConnectStatus::Pending;
    }
    const CURLcode rc = handshake_.get();
    if (rc != CURLE_OK) {
      fail_(rc);
      return ConnectStatus::Failed;
    }
    state_ = State::Open;
    return ConnectStatus::Open;
  }

  bool send_text(std::string_view text) override {
    if (state_ != State::Open) return false;
    std::size_t offset = 0;
    do {
      std::size_t sent = 0;
      const CURLcode rc = curl_ws_send(curl_, text.data() + offset, text.size() - offset, &sent, 0, CURLWS_TEXT);
      if (rc == CURLE_AGAIN) {
        error_ = "send would block";
        return false;
      }
      if (rc != CURLE_OK) {
        fail_(rc);
        return false;
      }
      if (sent == 0) {
        error_ = "send made no progress";
        return false;
      }
      offset += sent;
    } while (offset < text.size());
    return true;
  }

  bool read_messages(std::vector<std::string>& out) override {
    if (state_ != State::Open) return false;

    for (;;) {
      std::size_t got = 0;
      const curl_ws_frame* meta = nullptr;
      const CURLcode rc = curl_ws_recv(curl_, buf_.data(), buf_.size(), &got, &meta);
      if (rc == CURLE_AGAIN) return true;
      if (rc == CURLE_GOT_NOTHING) {
        error_ = "connection closed by server";
        state_ = State::Failed;
        return false;
      }
      if (rc != CURLE_OK) {
        fail_(rc);
        return false;
      }
      if (!meta) continue;

      if (meta->flags & CURLWS_CLOSE) {
        error_ = "server sent close";
        state_ = State::Failed;
        return false;
      }
      // libcurl answers pings itself
      if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;

      partial_.append(buf_.data(), got);
      if (partial_.size() > kMaxMessage) {
        error_ = "message too large";
        state_ = State::Failed;
        return false;
      }
      // frame complete and no further fragments
      if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
        out.push_back(std::exchange(partial_, {}));
      }
    }
  }

  const std::string& error() const override { return error_; }

private:
  enum class State { Connecting, Open, Failed };

  void fail_(CURLcode rc) {
    state_ = State::Failed;
    error_ = errbuf_[0] != '\0' ? std::string(errbuf_.data()) : std::string(curl_easy_strerror(rc));
  }

  CURL* curl_ = nullptr;
  State state_ = State::Connecting;
  std::future<CURLcode> handshake_;
  std::atomic<bool> abort_{false};
  std::array<char, CURL_ERROR_SIZE> errbuf_{};
  std::array<char, 64 * 1024> buf_{};
  std::string partial_;
  std::string error_;
};

} // namespace

std::unique_ptr<Connection> Connection::create_websocket(const std::string& url, long connect_timeout_s) {
  spdlog::debug("transport: connecting to {}", url);
  return std::make_unique<CurlWsConnection>(url, connect_timeout_s);
}

} // namespace f1live
