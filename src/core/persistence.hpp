#pragma once

#include "core/sector_batch.hpp"
#include "core/sector_parameters.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sector_mapper
{
namespace persistence
{

struct workspace_t
{
  struct camera_t
  {
    double lat = 0.0;
    double lon = 0.0;
    double zoom = 14.0;
  } camera;

  sector_parameters_t sector;

  struct data_t
  {
    std::string csv_file;
    int map_source = 0; // 0=OSM, 1=Satellite
  } data;
};

auto save_workspace(const std::string &filename, const workspace_t &workspace) -> bool;
auto load_workspace(const std::string &filename, workspace_t &workspace) -> bool;

// GeoJSON FeatureCollection, coordinates in [lon, lat] order.
// Styling goes into simplestyle properties (fill, fill-opacity, stroke, stroke-width).
auto to_geojson(const std::vector<sector_t> &sectors, const sector_parameters_t &style) -> nlohmann::json;
auto export_geojson(const std::string &filename, const std::vector<sector_t> &sectors, const sector_parameters_t &style) -> bool;

} // namespace persistence
} // namespace sector_mapper
