#pragma once

#include "core/sector_batch.hpp"
#include "core/sector_parameters.hpp"
#include "core/tile_service.hpp"
#include "imgui.h"
#include <memory>
#include <vector>

namespace sector_mapper
{

class map_widget_t
{
public:
  map_widget_t();
  ~map_widget_t() = default;

  auto update() -> void;
  auto draw(const std::vector<sector_t> &sectors, const sector_parameters_t &params) -> void;

  auto set_center(double lat, double lon) -> void;
  auto get_center_lat() const -> double
  {
    return m_center_lat;
  }
  auto get_center_lon() const -> double
  {
    return m_center_lon;
  }

  auto set_zoom(double zoom) -> void;
  auto get_zoom() const -> double
  {
    return m_zoom;
  }

  // 0 = OpenStreetMap, 1 = Satellite
  auto set_map_source(int source_index) -> void;
  auto get_map_source() const -> int;

  auto get_mouse_lat() const -> double
  {
    return m_mouse_lat;
  }
  auto get_mouse_lon() const -> double
  {
    return m_mouse_lon;
  }

  // Index into the last drawn sector list, -1 if none
  auto get_hovered_sector() const -> int
  {
    return m_hovered_sector;
  }

  static constexpr double MIN_ZOOM = 1.0;
  static constexpr double MAX_ZOOM = 19.0;

private:
  double m_center_lat;
  double m_center_lon;
  double m_zoom; // Double for smooth zoom

  double m_mouse_lat = 0.0;
  double m_mouse_lon = 0.0;
  int m_hovered_sector = -1;

  std::unique_ptr<tile_service_t> m_tile_service;

  auto world_size_pixels() const -> double;
  auto lat_lon_to_screen(double lat, double lon, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) const -> ImVec2;
  auto screen_to_lat_lon(const ImVec2 &p, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz, double &lat_out, double &lon_out) const -> void;

  auto handle_input(const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto draw_tiles(ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto draw_sectors(ImDrawList *draw_list, const std::vector<sector_t> &sectors, const sector_parameters_t &params, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto draw_status(ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) const -> void;
};

} // namespace sector_mapper
