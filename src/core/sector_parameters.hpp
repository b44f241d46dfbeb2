#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace sector_mapper
{

using rgb_t = std::array<float, 3>;

// Rendering-time configuration. The geometry engine only ever sees radius_m,
// passed explicitly per call.
struct sector_parameters_t
{
  double radius_m = 300.0;
  float fill_opacity = 0.5f;
  rgb_t fill_color = {0x33 / 255.0f, 0x88 / 255.0f, 0xff / 255.0f}; // #3388ff
  rgb_t border_color = {0.0f, 0.0f, 0.0f};
  float border_weight = 1.0f;
  std::size_t max_sectors = 100;
};

constexpr double MIN_RADIUS_SLIDER_M = 50.0;
constexpr double MAX_RADIUS_SLIDER_M = 2000.0;

// Upper bound for max_sectors, wherever it comes from (CLI, workspace, UI)
constexpr std::size_t MAX_SECTOR_LIMIT = 100000;

// "#rrggbb" or "rrggbb", case-insensitive
auto parse_hex_color(const std::string &text) -> std::optional<rgb_t>;
auto to_hex_color(const rgb_t &color) -> std::string;

// Whole-number sector cap in [1, MAX_SECTOR_LIMIT]; nullopt for anything else
auto parse_sector_limit(const std::string &text) -> std::optional<std::size_t>;

// Pull out-of-range values (e.g. from a hand-edited workspace) back into range
auto clamp_parameters(sector_parameters_t params) -> sector_parameters_t;

} // namespace sector_mapper
