#pragma once

#include "antenna_record.hpp"
#include "geo_math.hpp"
#include "sector_parameters.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sector_mapper
{

// Closed ring of (lat, lon) points. First and last point are the antenna location.
using geo_polygon_t = std::vector<geo_point_t>;

class invalid_geometry_error : public std::invalid_argument
{
public:
  explicit invalid_geometry_error(const std::string &what) : std::invalid_argument(what)
  {
  }
};

struct sector_result_t
{
  std::optional<geo_polygon_t> polygon;
  std::string error; // empty on success

  auto ok() const -> bool
  {
    return polygon.has_value();
  }
};

constexpr int MIN_ARC_POINTS = 3;
constexpr int NARROW_BEAM_ARC_POINTS = 10;
constexpr double NARROW_BEAM_THRESHOLD_DEG = 10.0;
constexpr double MAX_BEAMWIDTH_DEG = 360.0;

// Number of arc samples for a beamwidth: about one per degree for wide beams,
// a fixed 10 for narrow ones, never below 3. Halves round to even (60.5 -> 60).
auto arc_point_count(double beamwidth_deg) -> int;

// Returns a description of the first invalid input, or nullopt if the inputs are usable
auto validate_sector_input(double latitude, double longitude, double azimuth, double beamwidth, double radius_m) -> std::optional<std::string>;

// Throws invalid_geometry_error on invalid input. Stateless and thread-safe.
auto compute_sector_polygon(double latitude, double longitude, double azimuth, double beamwidth, double radius_m) -> geo_polygon_t;

// Non-throwing variant for batch use
auto try_compute_sector_polygon(const antenna_record_t &record, const sector_parameters_t &params) -> sector_result_t;

} // namespace sector_mapper
