#include "core/persistence.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace sector_mapper
{
namespace persistence
{

auto save_workspace(const std::string &filename, const workspace_t &workspace) -> bool
{
  json j;

  j["camera"] = {{"lat", workspace.camera.lat}, {"lon", workspace.camera.lon}, {"zoom", workspace.camera.zoom}};

  const auto &s = workspace.sector;
  j["sector"] = {{"radius_m", s.radius_m},
                 {"fill_opacity", s.fill_opacity},
                 {"fill_color", to_hex_color(s.fill_color)},
                 {"border_color", to_hex_color(s.border_color)},
                 {"border_weight", s.border_weight},
                 {"max_sectors", s.max_sectors}};

  j["data"] = {{"csv_file", workspace.data.csv_file}, {"map_source", workspace.data.map_source}};

  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Workspace: Failed to open " << filename << " for writing" << std::endl;
    return false;
  }

  file << j.dump(4);
  return true;
}

auto load_workspace(const std::string &filename, workspace_t &workspace) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error: " << e.what() << std::endl;
    return false;
  }

  if (!j.is_object())
  {
    std::cerr << "Workspace: " << filename << " is not a JSON object" << std::endl;
    return false;
  }

  const workspace_t defaults;

  try
  {
    if (j.contains("camera"))
    {
      workspace.camera.lat = j["camera"].value("lat", defaults.camera.lat);
      workspace.camera.lon = j["camera"].value("lon", defaults.camera.lon);
      workspace.camera.zoom = j["camera"].value("zoom", defaults.camera.zoom);
    }

    if (j.contains("sector"))
    {
      const auto &js = j["sector"];
      auto &s = workspace.sector;
      s.radius_m = js.value("radius_m", defaults.sector.radius_m);
      s.fill_opacity = js.value("fill_opacity", defaults.sector.fill_opacity);
      s.border_weight = js.value("border_weight", defaults.sector.border_weight);
      if (js.contains("max_sectors"))
      {
        // Any JSON number; negative or huge values must not wrap around in size_t
        double limit = js["max_sectors"].get<double>();
        if (!std::isfinite(limit) || limit < 1.0)
          limit = 1.0;
        s.max_sectors = static_cast<std::size_t>(std::min(limit, static_cast<double>(MAX_SECTOR_LIMIT)));
      }
      else
      {
        s.max_sectors = defaults.sector.max_sectors;
      }

      auto fill = parse_hex_color(js.value("fill_color", std::string()));
      s.fill_color = fill ? *fill : defaults.sector.fill_color;
      auto border = parse_hex_color(js.value("border_color", std::string()));
      s.border_color = border ? *border : defaults.sector.border_color;

      s = clamp_parameters(s);
    }

    if (j.contains("data"))
    {
      workspace.data.csv_file = j["data"].value("csv_file", defaults.data.csv_file);
      workspace.data.map_source = j["data"].value("map_source", defaults.data.map_source);
    }
  }
  catch (const json::type_error &e)
  {
    std::cerr << "Workspace: Unexpected value type in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  return true;
}

auto to_geojson(const std::vector<sector_t> &sectors, const sector_parameters_t &style) -> json
{
  json features = json::array();
  const std::string fill = to_hex_color(style.fill_color);
  const std::string stroke = to_hex_color(style.border_color);

  for (const auto &sector : sectors)
  {
    json ring = json::array();
    for (const auto &p : sector.polygon)
    {
      ring.push_back({p.lon, p.lat});
    }

    features.push_back({{"type", "Feature"},
                        {"geometry", {{"type", "Polygon"}, {"coordinates", json::array({ring})}}},
                        {"properties",
                         {{"enodeb_id", sector.record.enodeb_id},
                          {"cell_id", sector.record.cell_id},
                          {"azimuth", sector.record.azimuth},
                          {"beamwidth", sector.record.beamwidth},
                          {"row", sector.record.row_index},
                          {"fill", fill},
                          {"fill-opacity", style.fill_opacity},
                          {"stroke", stroke},
                          {"stroke-width", style.border_weight}}}});
  }

  return {{"type", "FeatureCollection"}, {"features", features}};
}

auto export_geojson(const std::string &filename, const std::vector<sector_t> &sectors, const sector_parameters_t &style) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "GeoJSON: Failed to open " << filename << " for writing" << std::endl;
    return false;
  }

  file << to_geojson(sectors, style).dump(2);
  std::cout << "GeoJSON: Wrote " << sectors.size() << " sectors to " << filename << std::endl;
  return true;
}

} // namespace persistence
} // namespace sector_mapper
