#include "ui/app_ui.hpp"
#include "core/persistence.hpp"
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <format>
#include <portable-file-dialogs.h>

namespace sector_mapper
{

constexpr const char *WORKSPACE_FILE = "workspace.json";
constexpr double DEFAULT_VIEW_ZOOM = 14.0;

void app_ui_t::setup_style()
{
  ImGui::StyleColorsDark();

  ImGuiStyle &style = ImGui::GetStyle();
  ImVec4 *colors = style.Colors;

  colors[ImGuiCol_WindowBg] = ImVec4(0.11f, 0.11f, 0.13f, 1.00f);
  colors[ImGuiCol_PopupBg] = ImVec4(0.13f, 0.13f, 0.15f, 0.94f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.18f, 0.18f, 0.20f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.24f, 0.24f, 0.26f, 1.00f);
  colors[ImGuiCol_TitleBg] = ImVec4(0.08f, 0.08f, 0.09f, 1.00f);
  colors[ImGuiCol_TitleBgActive] = ImVec4(0.08f, 0.08f, 0.09f, 1.00f);
  colors[ImGuiCol_SliderGrab] = ImVec4(0.20f, 0.53f, 1.00f, 1.00f); // matches the default sector fill
  colors[ImGuiCol_SliderGrabActive] = ImVec4(0.26f, 0.59f, 0.98f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.20f, 0.20f, 0.22f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.28f, 0.28f, 0.30f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.06f, 0.53f, 0.98f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.20f, 0.20f, 0.22f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.26f, 0.26f, 0.28f, 1.00f);

  style.WindowRounding = 8.0f;
  style.FrameRounding = 6.0f;
  style.GrabRounding = 6.0f;
  style.PopupRounding = 6.0f;
  style.WindowPadding = ImVec2(12.0f, 12.0f);
  style.FramePadding = ImVec2(6.0f, 4.0f);
  style.ItemSpacing = ImVec2(8.0f, 6.0f);
}

void app_ui_t::set_status(const std::string &message, bool is_error)
{
  m_status_message = message;
  m_status_is_error = is_error;
}

void app_ui_t::rebuild_sectors()
{
  m_batch = build_sectors(m_loaded.records, m_params);
}

bool app_ui_t::load_csv(const std::string &path, map_widget_t &map)
{
  m_csv_path = path;
  snprintf(m_path_buffer, sizeof(m_path_buffer), "%s", path.c_str());

  m_loaded = antenna_csv_t::load(path);
  if (!m_loaded.ok())
  {
    set_status(m_loaded.error, true);
    m_batch = {};
    return false;
  }

  if (m_loaded.records.empty())
  {
    set_status("No sectors left after removing rows with missing values.", true);
    m_batch = {};
    return true;
  }

  set_status(std::format("Loaded {} sectors successfully.", m_loaded.records.size()), false);

  if (auto center = compute_view_center(m_loaded.records))
  {
    map.set_center(center->lat, center->lon);
    map.set_zoom(DEFAULT_VIEW_ZOOM);
  }

  rebuild_sectors();
  return true;
}

void app_ui_t::load_workspace(const std::string &path, map_widget_t &map)
{
  persistence::workspace_t ws;
  if (!persistence::load_workspace(path, ws))
  {
    set_status("Could not load workspace: " + path, true);
    return;
  }

  m_params = ws.sector;
  map.set_map_source(ws.data.map_source);

  if (!ws.data.csv_file.empty())
  {
    load_csv(ws.data.csv_file, map);
  }
  else
  {
    rebuild_sectors();
  }

  // The saved camera wins over the data-driven view center
  map.set_center(ws.camera.lat, ws.camera.lon);
  map.set_zoom(ws.camera.zoom);
}

void app_ui_t::save_workspace(const std::string &path, const map_widget_t &map)
{
  persistence::workspace_t ws;
  ws.camera.lat = map.get_center_lat();
  ws.camera.lon = map.get_center_lon();
  ws.camera.zoom = map.get_zoom();
  ws.sector = m_params;
  ws.data.csv_file = m_csv_path;
  ws.data.map_source = map.get_map_source();

  if (persistence::save_workspace(path, ws))
    set_status("Saved workspace: " + path, false);
  else
    set_status("Could not save workspace: " + path, true);
}

void app_ui_t::render(map_widget_t &map, std::function<void()> on_exit)
{
  ImGui::DockSpaceOverViewport(0, ImGui::GetMainViewport());

  render_main_menu(map, on_exit);

  if (m_show_settings)
  {
    ImGui::SetNextWindowSize(ImVec2(360, 620), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Map Settings", &m_show_settings))
    {
      render_data_panel(map);
      ImGui::Separator();
      render_map_settings(map);
      ImGui::Separator();
      render_warnings();
    }
    ImGui::End();
  }

  if (m_show_raw_data)
  {
    if (ImGui::Begin("Raw Data", &m_show_raw_data))
    {
      render_raw_data();
    }
    ImGui::End();
  }

  if (m_show_map_view)
  {
    ImGui::SetNextWindowSize(ImVec2(900, 620), ImGuiCond_FirstUseEver);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    if (ImGui::Begin("Map View", &m_show_map_view))
    {
      map.draw(m_batch.sectors, m_params);
    }
    ImGui::End();
    ImGui::PopStyleVar();
  }
}

void app_ui_t::render_main_menu(map_widget_t &map, std::function<void()> on_exit)
{
  if (!ImGui::BeginMainMenuBar())
    return;

  if (ImGui::BeginMenu("File"))
  {
    if (ImGui::MenuItem("Load Workspace"))
    {
      load_workspace(WORKSPACE_FILE, map);
    }
    if (ImGui::MenuItem("Save Workspace"))
    {
      save_workspace(WORKSPACE_FILE, map);
    }
    ImGui::Separator();
    if (ImGui::MenuItem("Reload CSV", nullptr, false, !m_csv_path.empty()))
    {
      load_csv(m_csv_path, map);
    }
    ImGui::Separator();
    if (ImGui::MenuItem("Exit"))
    {
      if (on_exit)
        on_exit();
    }
    ImGui::EndMenu();
  }

  if (ImGui::BeginMenu("View"))
  {
    ImGui::MenuItem("Map Settings", nullptr, &m_show_settings);
    ImGui::MenuItem("Map View", nullptr, &m_show_map_view);
    ImGui::MenuItem("Raw Data", nullptr, &m_show_raw_data);
    ImGui::Separator();
    if (ImGui::MenuItem("Center On Sectors", nullptr, false, !m_loaded.records.empty()))
    {
      if (auto center = compute_view_center(m_loaded.records))
        map.set_center(center->lat, center->lon);
    }
    ImGui::EndMenu();
  }

  ImGui::EndMainMenuBar();
}

void app_ui_t::render_data_panel(map_widget_t &map)
{
  ImGui::TextDisabled("ANTENNA CSV");

  if (ImGui::Button("Browse CSV...", ImVec2(-1, 0)))
  {
    auto selection = pfd::open_file("Open Antenna CSV", ".", {"CSV Files", "*.csv", "All Files", "*"}, pfd::opt::none).result();
    if (!selection.empty())
    {
      std::snprintf(m_path_buffer, sizeof(m_path_buffer), "%s", selection[0].c_str());
      load_csv(selection[0], map);
    }
  }

  ImGui::InputText("Path", m_path_buffer, sizeof(m_path_buffer));
  if (ImGui::Button("Load CSV", ImVec2(-1, 0)))
  {
    std::string path(m_path_buffer);
    if (!path.empty())
      load_csv(path, map);
  }

  if (m_csv_path.empty())
  {
    ImGui::TextWrapped("Load a CSV file with the following columns: %s", antenna_csv_t::required_columns_text().c_str());
  }

  if (!m_status_message.empty())
  {
    ImVec4 color = m_status_is_error ? ImVec4(1.0f, 0.4f, 0.4f, 1.0f) : ImVec4(0.4f, 1.0f, 0.4f, 1.0f);
    ImGui::PushStyleColor(ImGuiCol_Text, color);
    ImGui::TextWrapped("%s", m_status_message.c_str());
    ImGui::PopStyleColor();
  }

  if (m_loaded.ok() && !m_loaded.columns.empty())
  {
    ImGui::Text("Plotted: %zu  Failed: %zu", m_batch.sectors.size(), m_batch.failures.size());
    if (m_loaded.dropped_rows > 0)
      ImGui::TextDisabled("%zu rows dropped (missing values)", m_loaded.dropped_rows);
    if (m_batch.capped > 0)
      ImGui::TextDisabled("%zu records beyond the %zu sector limit", m_batch.capped, m_params.max_sectors);

    if (ImGui::Button("View Raw Data"))
      m_show_raw_data = true;

    ImGui::SameLine();
    if (ImGui::Button("Export GeoJSON"))
    {
      auto out = pfd::save_file("Export Sectors", m_export_buffer, {"GeoJSON", "*.geojson *.json"}, pfd::opt::none).result();
      if (!out.empty())
      {
        std::snprintf(m_export_buffer, sizeof(m_export_buffer), "%s", out.c_str());
        if (persistence::export_geojson(out, m_batch.sectors, m_params))
          set_status(std::format("Exported {} sectors to {}", m_batch.sectors.size(), out), false);
        else
          set_status("Could not write " + out, true);
      }
    }
  }
}

void app_ui_t::render_map_settings(map_widget_t &map)
{
  ImGui::TextDisabled("MAP SETTINGS");

  bool changed = false;

  float radius = static_cast<float>(m_params.radius_m);
  if (ImGui::SliderFloat("Sector Radius (m)", &radius, static_cast<float>(MIN_RADIUS_SLIDER_M), static_cast<float>(MAX_RADIUS_SLIDER_M), "%.0f"))
  {
    // 50 m steps
    m_params.radius_m = std::clamp(std::round(radius / 50.0f) * 50.0, MIN_RADIUS_SLIDER_M, MAX_RADIUS_SLIDER_M);
    changed = true;
  }

  // Opacity and color only restyle, the polygons stay valid
  float opacity = m_params.fill_opacity;
  if (ImGui::SliderFloat("Fill Opacity", &opacity, 0.0f, 1.0f, "%.1f"))
  {
    m_params.fill_opacity = std::round(opacity * 10.0f) / 10.0f;
  }

  ImGui::ColorEdit3("Sector Color", m_params.fill_color.data());

  if (ImGui::CollapsingHeader("Advanced"))
  {
    ImGui::ColorEdit3("Border Color", m_params.border_color.data());
    ImGui::SliderFloat("Border Weight", &m_params.border_weight, 0.0f, 5.0f, "%.1f px");

    int max_sectors = static_cast<int>(m_params.max_sectors);
    if (ImGui::InputInt("Max Sectors", &max_sectors, 10, 100))
    {
      m_params.max_sectors = static_cast<size_t>(std::clamp(max_sectors, 1, static_cast<int>(MAX_SECTOR_LIMIT)));
      changed = true;
    }
  }

  const char *sources[] = {"OpenStreetMap", "Satellite"};
  int source = map.get_map_source();
  if (ImGui::Combo("Map Source", &source, sources, IM_ARRAYSIZE(sources)))
  {
    map.set_map_source(source);
  }

  if (changed)
  {
    rebuild_sectors();
  }
}

void app_ui_t::render_raw_data()
{
  if (m_loaded.columns.empty())
  {
    ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "No data loaded.");
    return;
  }

  const int column_count = static_cast<int>(std::min<size_t>(m_loaded.columns.size(), 64));
  ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollX | ImGuiTableFlags_SizingFixedFit;
  if (ImGui::BeginTable("##raw_data", column_count, flags))
  {
    for (int c = 0; c < column_count; ++c)
    {
      ImGui::TableSetupColumn(m_loaded.columns[static_cast<size_t>(c)].c_str());
    }
    ImGui::TableHeadersRow();

    for (const auto &row : m_loaded.preview)
    {
      ImGui::TableNextRow();
      for (int c = 0; c < column_count; ++c)
      {
        ImGui::TableSetColumnIndex(c);
        if (static_cast<size_t>(c) < row.size())
          ImGui::TextUnformatted(row[static_cast<size_t>(c)].c_str());
      }
    }
    ImGui::EndTable();
  }
  ImGui::TextDisabled("First %zu rows", m_loaded.preview.size());
}

void app_ui_t::render_warnings()
{
  const size_t count = m_loaded.issues.size() + m_batch.failures.size();
  ImGui::TextDisabled("WARNINGS (%zu)", count);
  if (count == 0)
    return;

  if (ImGui::BeginChild("##warnings", ImVec2(0, 160), true))
  {
    const ImVec4 warn_col(1.0f, 0.8f, 0.3f, 1.0f);
    for (const auto &issue : m_loaded.issues)
    {
      ImGui::TextColored(warn_col, "%s", issue.message.c_str());
    }
    for (const auto &failure : m_batch.failures)
    {
      ImGui::TextColored(warn_col, "%s", failure.message.c_str());
    }
  }
  ImGui::EndChild();
}

} // namespace sector_mapper
