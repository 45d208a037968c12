#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <f1live/config.hpp>
#include <f1live/http_client.hpp>
#include <f1live/viewer/app.hpp>
#include <f1live/ws_url.hpp>

using namespace f1live;

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto cli = parse_command_line(args);
  if (!cli) {
    std::fputs(usage_text(), stderr);
    return 2;
  }
  if (cli->help) {
    std::fputs(usage_text(), stdout);
    return 0;
  }

  ViewerConfig cfg;
  if (cli->config_path && !load_config_file(*cli->config_path, cfg)) {
    spdlog::error("cannot open config file {}", *cli->config_path);
    return 1;
  }
  if (cli->url) {
    if (!parse_ws_url(*cli->url)) {
      spdlog::error("invalid --url '{}', expected ws://host[:port]/path", *cli->url);
      return 2;
    }
    cfg.ws_url = *cli->url;
  }
  if (cli->log_level) cfg.log_level = *cli->log_level;

  const auto level = parse_log_level(cfg.log_level);
  if (!level) {
    spdlog::error("unknown log level '{}'", cfg.log_level);
    return 2;
  }
  spdlog::set_level(*level);

  CurlGlobal curl;
  ViewerApp app(cfg);
  return app.run();
}
