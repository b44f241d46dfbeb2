#include "sector_parameters.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <format>

namespace sector_mapper
{

static auto hex_digit(char c) -> int
{
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  return -1;
}

auto parse_hex_color(const std::string &text) -> std::optional<rgb_t>
{
  std::string hex = text;
  if (!hex.empty() && hex.front() == '#')
    hex.erase(0, 1);

  if (hex.size() != 6)
    return std::nullopt;

  rgb_t color{};
  for (size_t i = 0; i < 3; ++i)
  {
    int hi = hex_digit(hex[i * 2]);
    int lo = hex_digit(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    color[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }
  return color;
}

auto to_hex_color(const rgb_t &color) -> std::string
{
  auto channel = [](float v) { return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };
  return std::format("#{:02x}{:02x}{:02x}", channel(color[0]), channel(color[1]), channel(color[2]));
}

auto parse_sector_limit(const std::string &text) -> std::optional<std::size_t>
{
  const char *first = text.data();
  const char *last = text.data() + text.size();
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last)
    return std::nullopt;
  if (value < 1 || value > MAX_SECTOR_LIMIT)
    return std::nullopt;
  return value;
}

auto clamp_parameters(sector_parameters_t params) -> sector_parameters_t
{
  if (!std::isfinite(params.radius_m) || params.radius_m < 1.0)
    params.radius_m = 1.0;
  params.fill_opacity = std::clamp(params.fill_opacity, 0.0f, 1.0f);
  if (params.border_weight < 0.0f)
    params.border_weight = 0.0f;
  params.max_sectors = std::clamp(params.max_sectors, std::size_t{1}, MAX_SECTOR_LIMIT);
  for (auto &c : params.fill_color)
    c = std::clamp(c, 0.0f, 1.0f);
  for (auto &c : params.border_color)
    c = std::clamp(c, 0.0f, 1.0f);
  return params;
}

} // namespace sector_mapper
