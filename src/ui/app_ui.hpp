#pragma once

#include "core/antenna_csv.hpp"
#include "core/sector_batch.hpp"
#include "core/sector_parameters.hpp"
#include "ui/map_widget.hpp"
#include <functional>
#include <string>

namespace sector_mapper
{

class app_ui_t
{
public:
  app_ui_t() = default;
  ~app_ui_t() = default;

  // Apply custom style/theme
  void setup_style();

  void render(map_widget_t &map, std::function<void()> on_exit);

  // Load a CSV and rebuild the sectors. Returns false on a blocking error.
  bool load_csv(const std::string &path, map_widget_t &map);

  void load_workspace(const std::string &path, map_widget_t &map);
  void save_workspace(const std::string &path, const map_widget_t &map);

  const sector_parameters_t &get_parameters() const
  {
    return m_params;
  }
  const sector_batch_t &get_batch() const
  {
    return m_batch;
  }

private:
  void render_main_menu(map_widget_t &map, std::function<void()> on_exit);
  void render_map_settings(map_widget_t &map);
  void render_data_panel(map_widget_t &map);
  void render_raw_data();
  void render_warnings();

  void rebuild_sectors();
  void set_status(const std::string &message, bool is_error);

  sector_parameters_t m_params;
  antenna_load_result_t m_loaded;
  sector_batch_t m_batch;
  std::string m_csv_path;

  char m_path_buffer[512] = "";
  char m_export_buffer[512] = "sectors.geojson";

  std::string m_status_message;
  bool m_status_is_error = false;

  // UI State
  bool m_show_settings = true;
  bool m_show_map_view = true;
  bool m_show_raw_data = false;
};

} // namespace sector_mapper
