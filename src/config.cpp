#include <f1live/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>

#include <spdlog/spdlog.h>

#include <f1live/ws_url.hpp>

namespace f1live {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static double to_double_safe(const std::string& s, bool& ok) {
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  ok = !s.empty() && end == s.c_str() + s.size();
  return v;
}

std::string ViewerConfig::resolved_http_base() const {
  return http_base.empty() ? http_base_from_ws_url(ws_url) : http_base;
}

namespace {

using Setter = std::function<bool(ViewerConfig&, const std::string&)>;

template <typename Fn>
Setter number(Fn apply) {
  return [apply](ViewerConfig& c, const std::string& v) {
    bool ok = false;
    const double d = to_double_safe(v, ok);
    if (!ok) return false;
    return apply(c, d);
  };
}

bool positive(double d) { return d > 0.0; }

const std::map<std::string, Setter>& setters() {
  static const std::map<std::string, Setter> table = {
    {"ws_url", [](ViewerConfig& c, const std::string& v) {
       if (!parse_ws_url(v)) return false;
       c.ws_url = v;
       return true;
     }},
    {"http_base", [](ViewerConfig& c, const std::string& v) { c.http_base = v; return true; }},
    {"log_level", [](ViewerConfig& c, const std::string& v) {
       if (!parse_log_level(v)) return false;
       c.log_level = v;
       return true;
     }},
    {"window_width",      number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.window_width = int(d); return true; })},
    {"window_height",     number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.window_height = int(d); return true; })},
    {"target_fps",        number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.target_fps = int(d); return true; })},
    {"reconnect_base_ms", number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.reconnect_base_ms = int(d); return true; })},
    {"reconnect_cap_ms",  number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.reconnect_cap_ms = int(d); return true; })},
    {"http_timeout_s",    number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.http_timeout_s = long(d); return true; })},
    {"restart_threshold_s", number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.restart_threshold_s = d; return true; })},

    {"track_width",     number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.surface.track_width = d; return true; })},
    {"track_tolerance", number([](ViewerConfig& c, double d) { if (d < 0.0) return false; c.surface.tolerance = d; return true; })},
    {"kerb_offset",     number([](ViewerConfig& c, double d) { c.surface.kerb_offset = d; return true; })},
    {"kerb_width",      number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.surface.kerb_width = d; return true; })},
    {"kerb_height",     number([](ViewerConfig& c, double d) { if (d < 0.0) return false; c.surface.kerb_height = d; return true; })},
    {"track_segments",  number([](ViewerConfig& c, double d) { if (d < 0.0) return false; c.surface.track_segments = int(d); return true; })},
    {"kerb_segments",   number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.surface.kerb_segments = int(d); return true; })},

    // blend factors must stay inside (0, 1) or smoothing can overshoot
    {"interp_base",  number([](ViewerConfig& c, double d) { if (d <= 0.0 || d >= 1.0) return false; c.motion.base_factor = d; return true; })},
    {"interp_scale", number([](ViewerConfig& c, double d) { if (d < 0.0) return false; c.motion.scale_factor = d; return true; })},
    {"interp_max",   number([](ViewerConfig& c, double d) { if (d <= 0.0 || d >= 1.0) return false; c.motion.max_factor = d; return true; })},
    {"car_height_offset", number([](ViewerConfig& c, double d) { c.motion.height_offset = d; return true; })},
    {"angle_offset",      number([](ViewerConfig& c, double d) { c.motion.angle_offset = d; return true; })},
    {"min_motion",        number([](ViewerConfig& c, double d) { if (d < 0.0) return false; c.motion.min_motion = d; return true; })},

    {"camera_follow_lerp", number([](ViewerConfig& c, double d) { if (d <= 0.0 || d > 1.0) return false; c.view.follow_lerp = d; return true; })},
    {"zoom_min", number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.view.zoom_min = d; return true; })},
    {"zoom_max", number([](ViewerConfig& c, double d) { if (!positive(d)) return false; c.view.zoom_max = d; return true; })},
  };
  return table;
}

} // namespace

std::size_t apply_config_stream(std::istream& in, ViewerConfig& cfg) {
  std::size_t applied = 0;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      spdlog::warn("config:{}: expected key = value", lineno);
      continue;
    }
    const std::string key = trim(raw.substr(0, eq));
    const std::string value = trim(raw.substr(eq + 1));

    auto it = setters().find(key);
    if (it == setters().end()) {
      spdlog::warn("config:{}: unknown key '{}'", lineno, key);
      continue;
    }
    if (!it->second(cfg, value)) {
      spdlog::warn("config:{}: bad value '{}' for {}", lineno, value, key);
      continue;
    }
    ++applied;
  }

  if (cfg.reconnect_cap_ms < cfg.reconnect_base_ms) cfg.reconnect_cap_ms = cfg.reconnect_base_ms;
  if (cfg.motion.max_factor < cfg.motion.base_factor) cfg.motion.max_factor = cfg.motion.base_factor;
  return applied;
}

bool load_config_file(const std::string& path, ViewerConfig& cfg) {
  std::ifstream f(path);
  if (!f) return false;
  const std::size_t n = apply_config_stream(f, cfg);
  spdlog::info("config: {} value(s) from {}", n, path);
  return true;
}

std::optional<CliOptions> parse_command_line(const std::vector<std::string>& args) {
  CliOptions out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") {
      out.help = true;
      continue;
    }
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= args.size()) return std::nullopt;
      return args[++i];
    };
    std::optional<std::string>* slot = nullptr;
    if (a == "--config")         slot = &out.config_path;
    else if (a == "--url")       slot = &out.url;
    else if (a == "--log-level") slot = &out.log_level;
    else return std::nullopt;

    auto v = value();
    if (!v) return std::nullopt;
    *slot = std::move(v);
  }
  return out;
}

const char* usage_text() {
  return "usage: f1live_viewer [--config FILE] [--url ws://host:port/ws] [--log-level LEVEL]\n"
         "  LEVEL: trace | debug | info | warn | error | off\n";
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info")  return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "off")   return spdlog::level::off;
  return std::nullopt;
}

} // namespace f1live
