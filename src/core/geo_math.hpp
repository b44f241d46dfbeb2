#pragma once

#include <algorithm>
#include <cmath>

namespace sector_mapper
{

struct geo_point_t
{
  double lat = 0.0;
  double lon = 0.0;
};

namespace geo
{
constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6378137.0; // WGS-84 equatorial radius, used as a sphere

inline auto to_radians(double deg) -> double
{
  return deg * PI / 180.0;
}

inline auto to_degrees(double rad) -> double
{
  return rad * 180.0 / PI;
}

// Reduce any finite bearing into [0, 360)
inline auto normalize_bearing(double bearing_deg) -> double
{
  double b = std::fmod(bearing_deg, 360.0);
  if (b < 0.0)
    b += 360.0;
  if (b >= 360.0)
    b = 0.0;
  return b;
}

// Convert Latitude/Longitude to Web Mercator World Coordinate (0.0 to 1.0)
inline auto lat_lon_to_world(double lat, double lon, double &out_x, double &out_y) -> void
{
  out_x = (lon + 180.0) / 360.0;

  double sin_lat = std::sin(to_radians(lat));
  // Clamp to prevent singularity at poles
  sin_lat = std::clamp(sin_lat, -0.9999, 0.9999);

  out_y = 0.5 - std::log((1.0 + sin_lat) / (1.0 - sin_lat)) / (4.0 * PI);
}

// Convert Web Mercator World Coordinate (0.0 to 1.0) back to Latitude/Longitude
inline auto world_to_lat_lon(double wx, double wy, double &out_lat, double &out_lon) -> void
{
  out_lon = (wx * 360.0) - 180.0;

  double n = PI - 2.0 * PI * wy;
  out_lat = to_degrees(std::atan(0.5 * (std::exp(n) - std::exp(-n))));
}

// Forward geodesic on a sphere: move a point by distance (meters) along a bearing (degrees).
// Longitude is not wrapped back into [-180, 180].
inline auto destination_point(double lat, double lon, double dist_m, double bearing_deg) -> geo_point_t
{
  double lat_rad = to_radians(lat);
  double lon_rad = to_radians(lon);
  double bearing_rad = to_radians(bearing_deg);
  double angular_dist = dist_m / EARTH_RADIUS;

  double sin_lat2 = std::sin(lat_rad) * std::cos(angular_dist) + std::cos(lat_rad) * std::sin(angular_dist) * std::cos(bearing_rad);
  // Rounding can push the argument just past 1 at the poles
  sin_lat2 = std::clamp(sin_lat2, -1.0, 1.0);
  double lat2_rad = std::asin(sin_lat2);
  double lon2_rad = lon_rad + std::atan2(std::sin(bearing_rad) * std::sin(angular_dist) * std::cos(lat_rad), std::cos(angular_dist) - std::sin(lat_rad) * sin_lat2);

  return {to_degrees(lat2_rad), to_degrees(lon2_rad)};
}

// Calculate bearing from point A to point B in degrees [0, 360)
inline auto bearing(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = to_radians(lat1);
  double lat2_rad = to_radians(lat2);
  double delta_lon_rad = to_radians(lon2 - lon1);

  double y = std::sin(delta_lon_rad) * std::cos(lat2_rad);
  double x = std::cos(lat1_rad) * std::sin(lat2_rad) - std::sin(lat1_rad) * std::cos(lat2_rad) * std::cos(delta_lon_rad);

  return normalize_bearing(to_degrees(std::atan2(y, x)));
}

// Great-circle distance between two points in meters (Haversine)
inline auto distance(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = to_radians(lat1);
  double lat2_rad = to_radians(lat2);
  double delta_lat = to_radians(lat2 - lat1);
  double delta_lon = to_radians(lon2 - lon1);

  double a = std::sin(delta_lat / 2.0) * std::sin(delta_lat / 2.0) + std::cos(lat1_rad) * std::cos(lat2_rad) * std::sin(delta_lon / 2.0) * std::sin(delta_lon / 2.0);
  double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return EARTH_RADIUS * c;
}

} // namespace geo
} // namespace sector_mapper
