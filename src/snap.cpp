#include <f1live/snap.hpp>
#include <algorithm>
#include <cctype>
#include <string_view>

namespace f1live {

static int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l >= 'a' && l <= 'f') return 10 + (l - 'a');
  return -1;
}

std::optional<Rgb> parse_hex_color(const std::string& s) {
  std::string_view v(s);
  if (!v.empty() && v.front() == '#') v.remove_prefix(1);
  if (v.size() != 6) return std::nullopt;
  std::uint8_t out[3];
  for (int i = 0; i < 3; ++i) {
    const int hi = hex_digit(v[i*2]);
    const int lo = hex_digit(v[i*2 + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{out[0], out[1], out[2]};
}

bool positions_are_permutation(const RaceSnapshot& ss) {
  const int n = static_cast<int>(ss.cars.size());
  std::vector<bool> seen(static_cast<std::size_t>(n) + 1, false);
  for (const auto& c : ss.cars) {
    if (c.race_position < 1 || c.race_position > n) return false;
    if (seen[c.race_position]) return false;
    seen[c.race_position] = true;
  }
  return true;
}

const char* weather_label(double rain) {
  if (rain < 0.1) return "Dry";
  if (rain < 0.3) return "Light Rain";
  if (rain < 0.6) return "Medium Rain";
  return "Heavy Rain";
}

int leader_laps(const RaceSnapshot& ss) {
  int best = 0;
  for (const auto& c : ss.cars) best = std::max(best, c.laps_completed);
  return best;
}

} // namespace f1live
