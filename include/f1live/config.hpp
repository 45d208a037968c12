#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

#include <f1live/camera.hpp>
#include <f1live/interp.hpp>
#include <f1live/track_surface.hpp>

namespace f1live {

struct ViewerConfig {
  std::string ws_url{"ws://localhost:8000/ws"};
  std::string http_base;          // empty: derived from ws_url
  int window_width{1280};
  int window_height{800};
  int target_fps{60};
  int reconnect_base_ms{1000};
  int reconnect_cap_ms{30000};
  long http_timeout_s{5};          // HTTP requests and the stream connect + upgrade
  double restart_threshold_s{5.0};  // sim-time drop that counts as a server restart
  std::string log_level{"info"};

  SurfaceParams surface{};
  MotionParams motion{};
  ViewParams view{};

  std::string resolved_http_base() const;
};

// Reads `key = value` lines into cfg. Blank lines and '#' comments are
// ignored; unknown keys and unparsable values are skipped with a warning.
// Returns the number of values applied.
std::size_t apply_config_stream(std::istream& in, ViewerConfig& cfg);

// false when the file cannot be opened.
bool load_config_file(const std::string& path, ViewerConfig& cfg);

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> url;
  std::optional<std::string> log_level;
  bool help{false};
};

// --config FILE, --url URL, --log-level LEVEL, -h/--help.
// nullopt on an unknown flag or a flag missing its value.
std::optional<CliOptions> parse_command_line(const std::vector<std::string>& args);

const char* usage_text();

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace f1live
