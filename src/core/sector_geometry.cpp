#include "sector_geometry.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace sector_mapper
{

auto arc_point_count(double beamwidth_deg) -> int
{
  double bw = std::min(beamwidth_deg, MAX_BEAMWIDTH_DEG);
  int n = NARROW_BEAM_ARC_POINTS;
  if (bw > NARROW_BEAM_THRESHOLD_DEG)
  {
    // Default rounding mode: halves go to the even neighbour
    n = static_cast<int>(std::nearbyint(bw));
  }
  return std::max(MIN_ARC_POINTS, n);
}

auto validate_sector_input(double latitude, double longitude, double azimuth, double beamwidth, double radius_m) -> std::optional<std::string>
{
  if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0)
    return std::format("latitude {} is outside [-90, 90]", latitude);

  if (!std::isfinite(longitude) || longitude < -180.0 || longitude > 180.0)
    return std::format("longitude {} is outside [-180, 180]", longitude);

  if (!std::isfinite(azimuth))
    return std::format("azimuth {} is not a finite number", azimuth);

  if (!std::isfinite(beamwidth) || beamwidth <= 0.0)
    return std::format("beamwidth {} must be greater than 0", beamwidth);

  if (!std::isfinite(radius_m) || radius_m <= 0.0)
    return std::format("radius {} m must be greater than 0", radius_m);

  return std::nullopt;
}

// Inputs are already validated
static auto build_polygon(double latitude, double longitude, double azimuth, double beamwidth, double radius_m) -> geo_polygon_t
{
  const double bw = std::min(beamwidth, MAX_BEAMWIDTH_DEG);
  const int n = arc_point_count(bw);

  const double center_bearing = geo::normalize_bearing(azimuth);
  const double start_angle = center_bearing - bw / 2.0;
  const double end_angle = center_bearing + bw / 2.0;

  geo_polygon_t polygon;
  polygon.reserve(static_cast<size_t>(n) + 2);
  polygon.push_back({latitude, longitude});

  for (int i = 0; i < n; ++i)
  {
    double angle = start_angle + (end_angle - start_angle) * i / (n - 1);
    polygon.push_back(geo::destination_point(latitude, longitude, radius_m, angle));
  }

  polygon.push_back({latitude, longitude});
  return polygon;
}

auto compute_sector_polygon(double latitude, double longitude, double azimuth, double beamwidth, double radius_m) -> geo_polygon_t
{
  if (auto error = validate_sector_input(latitude, longitude, azimuth, beamwidth, radius_m))
  {
    throw invalid_geometry_error(*error);
  }
  return build_polygon(latitude, longitude, azimuth, beamwidth, radius_m);
}

auto try_compute_sector_polygon(const antenna_record_t &record, const sector_parameters_t &params) -> sector_result_t
{
  sector_result_t result;
  if (auto error = validate_sector_input(record.latitude, record.longitude, record.azimuth, record.beamwidth, params.radius_m))
  {
    result.error = std::move(*error);
    return result;
  }
  result.polygon = build_polygon(record.latitude, record.longitude, record.azimuth, record.beamwidth, params.radius_m);
  return result;
}

} // namespace sector_mapper
