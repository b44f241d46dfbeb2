#include "ui/map_widget.hpp"
#include "core/geo_math.hpp"
#include "imgui.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace sector_mapper
{

constexpr double TILE_SIZE = 256.0;
constexpr int MAX_VISIBLE_TILES = 100;

// Even-odd ray casting on screen coordinates
static bool is_point_in_polygon(const ImVec2 &p, const std::vector<ImVec2> &poly)
{
  bool inside = false;
  for (size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++)
  {
    const ImVec2 &a = poly[i];
    const ImVec2 &b = poly[j];
    if ((a.y > p.y) != (b.y > p.y))
    {
      float x_cross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < x_cross)
        inside = !inside;
    }
  }
  return inside;
}

static ImU32 to_im_color(const rgb_t &c, float alpha)
{
  return ImGui::ColorConvertFloat4ToU32(ImVec4(c[0], c[1], c[2], alpha));
}

map_widget_t::map_widget_t() : m_center_lat(-33.8688), m_center_lon(151.2093), m_zoom(14.0)
{
  m_tile_service = std::make_unique<tile_service_t>();
}

auto map_widget_t::update() -> void
{
  m_tile_service->update();
}

auto map_widget_t::set_center(double lat, double lon) -> void
{
  m_center_lat = std::clamp(lat, -85.0, 85.0);
  m_center_lon = lon;
}

auto map_widget_t::set_zoom(double zoom) -> void
{
  m_zoom = std::clamp(zoom, MIN_ZOOM, MAX_ZOOM);
}

auto map_widget_t::set_map_source(int source_index) -> void
{
  m_tile_service->set_source(source_index == 1 ? tile_service_t::tile_source_t::SATELLITE : tile_service_t::tile_source_t::OSM);
}

auto map_widget_t::get_map_source() const -> int
{
  return m_tile_service->get_source() == tile_service_t::tile_source_t::SATELLITE ? 1 : 0;
}

auto map_widget_t::world_size_pixels() const -> double
{
  return std::pow(2.0, m_zoom) * TILE_SIZE;
}

auto map_widget_t::draw(const std::vector<sector_t> &sectors, const sector_parameters_t &params) -> void
{
  update();

  ImVec2 canvas_p0 = ImGui::GetCursorScreenPos();
  ImVec2 canvas_sz_raw = ImGui::GetContentRegionAvail();
  ImVec2 canvas_sz(std::max(canvas_sz_raw.x, 50.0f), std::max(canvas_sz_raw.y, 50.0f));

  ImDrawList *draw_list = ImGui::GetWindowDrawList();
  draw_list->AddRectFilled(canvas_p0, ImVec2(canvas_p0.x + canvas_sz.x, canvas_p0.y + canvas_sz.y), IM_COL32(20, 20, 20, 255));

  handle_input(canvas_p0, canvas_sz);

  draw_list->PushClipRect(canvas_p0, ImVec2(canvas_p0.x + canvas_sz.x, canvas_p0.y + canvas_sz.y), true);
  draw_tiles(draw_list, canvas_p0, canvas_sz);
  draw_sectors(draw_list, sectors, params, canvas_p0, canvas_sz);
  draw_status(draw_list, canvas_p0, canvas_sz);
  draw_list->PopClipRect();

  if (m_hovered_sector >= 0 && m_hovered_sector < static_cast<int>(sectors.size()))
  {
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(8, 8));
    ImGui::BeginTooltip();
    ImGui::TextUnformatted(sectors[static_cast<size_t>(m_hovered_sector)].tooltip.c_str());
    ImGui::EndTooltip();
    ImGui::PopStyleVar();
  }
}

auto map_widget_t::handle_input(const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  ImGui::InvisibleButton("map_canvas", canvas_sz);
  const bool is_hovered = ImGui::IsItemHovered();
  const bool is_active = ImGui::IsItemActive();
  ImGuiIO &io = ImGui::GetIO();

  double center_wx, center_wy;
  geo::lat_lon_to_world(m_center_lat, m_center_lon, center_wx, center_wy);
  double world_px = world_size_pixels();

  if (is_hovered)
  {
    screen_to_lat_lon(io.MousePos, canvas_p0, canvas_sz, m_mouse_lat, m_mouse_lon);
  }

  // Zoom towards the cursor
  if (is_hovered && io.MouseWheel != 0.0f)
  {
    ImVec2 mouse_offset(io.MousePos.x - (canvas_p0.x + canvas_sz.x * 0.5f), io.MousePos.y - (canvas_p0.y + canvas_sz.y * 0.5f));

    double mouse_wx = center_wx + mouse_offset.x / world_px;
    double mouse_wy = center_wy + mouse_offset.y / world_px;

    set_zoom(m_zoom + io.MouseWheel * 0.5);
    world_px = world_size_pixels();

    geo::world_to_lat_lon(mouse_wx - mouse_offset.x / world_px, mouse_wy - mouse_offset.y / world_px, m_center_lat, m_center_lon);
    geo::lat_lon_to_world(m_center_lat, m_center_lon, center_wx, center_wy);
  }

  // Panning
  if (is_active && ImGui::IsMouseDragging(ImGuiMouseButton_Left))
  {
    double new_center_wx = center_wx - io.MouseDelta.x / world_px;
    double new_center_wy = center_wy - io.MouseDelta.y / world_px;

    if (new_center_wx > 1.0)
      new_center_wx -= 1.0;
    if (new_center_wx < 0.0)
      new_center_wx += 1.0;

    if (new_center_wy > 0.0 && new_center_wy < 1.0)
    {
      geo::world_to_lat_lon(new_center_wx, new_center_wy, m_center_lat, m_center_lon);
    }
  }
}

auto map_widget_t::draw_tiles(ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  double center_wx, center_wy;
  geo::lat_lon_to_world(m_center_lat, m_center_lon, center_wx, center_wy);
  const double world_px = world_size_pixels();

  ImVec2 screen_center(canvas_p0.x + canvas_sz.x * 0.5f, canvas_p0.y + canvas_sz.y * 0.5f);

  int tile_zoom = static_cast<int>(std::floor(m_zoom));
  double render_n = std::pow(2.0, tile_zoom);
  const int max_tile = 1 << tile_zoom;

  double view_half_w = (canvas_sz.x * 0.5f) / world_px;
  double view_half_h = (canvas_sz.y * 0.5f) / world_px;

  int min_tx = static_cast<int>(std::floor((center_wx - view_half_w) * render_n));
  int max_tx = static_cast<int>(std::floor((center_wx + view_half_w) * render_n));
  int min_ty = static_cast<int>(std::floor((center_wy - view_half_h) * render_n));
  int max_ty = static_cast<int>(std::floor((center_wy + view_half_h) * render_n));

  if ((max_tx - min_tx + 1) * (max_ty - min_ty + 1) > MAX_VISIBLE_TILES)
  {
    draw_list->AddText(ImVec2(canvas_p0.x + 10, canvas_p0.y + 10), IM_COL32(255, 255, 255, 255), "Zoom in to see map");
    return;
  }

  float tile_screen_size = static_cast<float>(TILE_SIZE * std::pow(2.0, m_zoom - tile_zoom));

  for (int x = min_tx; x <= max_tx; ++x)
  {
    for (int y = min_ty; y <= max_ty; ++y)
    {
      if (y < 0 || y >= max_tile)
        continue;

      int wrapped_x = ((x % max_tile) + max_tile) % max_tile;

      float draw_x = static_cast<float>((x / render_n - center_wx) * world_px + screen_center.x);
      float draw_y = static_cast<float>((y / render_n - center_wy) * world_px + screen_center.y);
      ImVec2 p_min(draw_x, draw_y);
      ImVec2 p_max(draw_x + tile_screen_size, draw_y + tile_screen_size);

      auto texture = m_tile_service->get_tile(tile_zoom, wrapped_x, y);
      if (texture && texture->is_valid())
      {
        draw_list->AddImage((ImTextureID)(intptr_t)texture->get_id(), p_min, p_max);
        continue;
      }

      // Show the matching part of a loaded parent tile while this one downloads
      bool found_fallback = false;
      for (int fallback_zoom = tile_zoom - 1; fallback_zoom >= 0 && !found_fallback; --fallback_zoom)
      {
        int zoom_diff = tile_zoom - fallback_zoom;
        int parent_tx = wrapped_x >> zoom_diff;
        int parent_ty = y >> zoom_diff;

        auto parent = m_tile_service->get_tile(fallback_zoom, parent_tx, parent_ty);
        if (!parent || !parent->is_valid())
          continue;

        float uv_scale = 1.0f / static_cast<float>(1 << zoom_diff);
        int sub_x = wrapped_x - (parent_tx << zoom_diff);
        int sub_y = y - (parent_ty << zoom_diff);
        ImVec2 uv_min(sub_x * uv_scale, sub_y * uv_scale);
        ImVec2 uv_max((sub_x + 1) * uv_scale, (sub_y + 1) * uv_scale);

        draw_list->AddImage((ImTextureID)(intptr_t)parent->get_id(), p_min, p_max, uv_min, uv_max);
        found_fallback = true;
      }

      if (!found_fallback)
      {
        draw_list->AddRectFilled(p_min, p_max, IM_COL32(40, 40, 40, 255));
        draw_list->AddRect(p_min, p_max, IM_COL32(80, 80, 80, 100));
      }
    }
  }
}

auto map_widget_t::draw_sectors(ImDrawList *draw_list, const std::vector<sector_t> &sectors, const sector_parameters_t &params, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void
{
  const ImU32 fill_col = to_im_color(params.fill_color, params.fill_opacity);
  const ImU32 border_col = to_im_color(params.border_color, 1.0f);
  const bool mouse_over_canvas = ImGui::IsItemHovered();
  const ImVec2 mouse = ImGui::GetIO().MousePos;

  m_hovered_sector = -1;
  std::vector<ImVec2> screen_points;

  for (size_t s = 0; s < sectors.size(); ++s)
  {
    const auto &polygon = sectors[s].polygon;
    if (polygon.size() < 4)
      continue;

    screen_points.clear();
    for (const auto &p : polygon)
    {
      screen_points.push_back(lat_lon_to_screen(p.lat, p.lon, canvas_p0, canvas_sz));
    }

    // The ring is star-shaped around the antenna, so a fan from the center fills it
    // exactly even when the beam is wider than 180 degrees.
    // Anti-aliased fringes would show as seams between the fan triangles.
    const ImDrawListFlags saved_flags = draw_list->Flags;
    draw_list->Flags &= ~ImDrawListFlags_AntiAliasedFill;
    const ImVec2 center = screen_points.front();
    for (size_t i = 1; i + 2 < screen_points.size(); ++i)
    {
      draw_list->AddTriangleFilled(center, screen_points[i], screen_points[i + 1], fill_col);
    }
    draw_list->Flags = saved_flags;

    if (params.border_weight > 0.0f)
    {
      // Last point repeats the first; Closed draws that edge
      draw_list->AddPolyline(screen_points.data(), static_cast<int>(screen_points.size()) - 1, border_col, ImDrawFlags_Closed, params.border_weight);
    }
    draw_list->AddCircleFilled(center, 3.0f, border_col);

    // Later sectors are drawn on top, so the last hit wins
    if (mouse_over_canvas && is_point_in_polygon(mouse, screen_points))
    {
      m_hovered_sector = static_cast<int>(s);
    }
  }
}

auto map_widget_t::draw_status(ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) const -> void
{
  char buf[96];
  snprintf(buf, sizeof(buf), "Zoom %.1f  |  %.5f, %.5f", m_zoom, m_mouse_lat, m_mouse_lon);

  ImVec2 text_sz = ImGui::CalcTextSize(buf);
  ImVec2 pos(canvas_p0.x + canvas_sz.x - text_sz.x - 12.0f, canvas_p0.y + canvas_sz.y - text_sz.y - 8.0f);
  draw_list->AddRectFilled(ImVec2(pos.x - 6.0f, pos.y - 3.0f), ImVec2(pos.x + text_sz.x + 6.0f, pos.y + text_sz.y + 3.0f), IM_COL32(0, 0, 0, 160), 4.0f);
  draw_list->AddText(pos, IM_COL32(255, 255, 255, 255), buf);

  // Tile attribution required by the OSM usage policy
  const char *attribution = get_map_source() == 0 ? "(c) OpenStreetMap contributors" : "Imagery (c) Esri";
  draw_list->AddText(ImVec2(canvas_p0.x + 8.0f, canvas_p0.y + canvas_sz.y - text_sz.y - 8.0f), IM_COL32(0, 0, 0, 200), attribution);
}

auto map_widget_t::lat_lon_to_screen(double lat, double lon, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) const -> ImVec2
{
  double wx, wy;
  geo::lat_lon_to_world(lat, lon, wx, wy);

  double center_wx, center_wy;
  geo::lat_lon_to_world(m_center_lat, m_center_lon, center_wx, center_wy);

  // Draw the copy of the point nearest to the view center
  if (wx - center_wx > 0.5)
    wx -= 1.0;
  if (wx - center_wx < -0.5)
    wx += 1.0;

  const double world_px = world_size_pixels();
  ImVec2 screen_center(canvas_p0.x + canvas_sz.x * 0.5f, canvas_p0.y + canvas_sz.y * 0.5f);
  return ImVec2(static_cast<float>((wx - center_wx) * world_px + screen_center.x), static_cast<float>((wy - center_wy) * world_px + screen_center.y));
}

auto map_widget_t::screen_to_lat_lon(const ImVec2 &p, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz, double &lat_out, double &lon_out) const -> void
{
  double center_wx, center_wy;
  geo::lat_lon_to_world(m_center_lat, m_center_lon, center_wx, center_wy);

  const double world_px = world_size_pixels();
  ImVec2 screen_center(canvas_p0.x + canvas_sz.x * 0.5f, canvas_p0.y + canvas_sz.y * 0.5f);

  double wx = center_wx + (p.x - screen_center.x) / world_px;
  double wy = center_wy + (p.y - screen_center.y) / world_px;

  wx = wx - std::floor(wx);
  wy = std::clamp(wy, 0.0, 1.0);

  geo::world_to_lat_lon(wx, wy, lat_out, lon_out);
}

} // namespace sector_mapper
