#include "../core/persistence.hpp"
#include "../core/sector_parameters.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace sector_mapper;
namespace fs = std::filesystem;

static fs::path temp_file(const std::string &name)
{
  return fs::temp_directory_path() / ("sector_mapper_verify_" + name);
}

void test_hex_colors()
{
  std::cout << "Testing hex colors..." << std::endl;
  auto c = parse_hex_color("#3388ff");
  assert(c.has_value());
  assert(std::abs((*c)[0] - 0x33 / 255.0f) < 1e-6f);
  assert(std::abs((*c)[1] - 0x88 / 255.0f) < 1e-6f);
  assert(std::abs((*c)[2] - 1.0f) < 1e-6f);
  assert(to_hex_color(*c) == "#3388ff");

  assert(parse_hex_color("FF0000").has_value());
  assert(to_hex_color(*parse_hex_color("FF0000")) == "#ff0000");
  assert(!parse_hex_color("#12345").has_value());
  assert(!parse_hex_color("#zz0000").has_value());
  assert(!parse_hex_color("").has_value());

  sector_parameters_t defaults;
  assert(to_hex_color(defaults.fill_color) == "#3388ff");
}

void test_clamp_parameters()
{
  std::cout << "Testing parameter clamping..." << std::endl;
  sector_parameters_t p;
  p.radius_m = -5.0;
  p.fill_opacity = 3.0f;
  p.border_weight = -1.0f;
  p.max_sectors = 0;
  p.fill_color = {2.0f, -1.0f, 0.5f};

  auto c = clamp_parameters(p);
  assert(c.radius_m == 1.0);
  assert(c.fill_opacity == 1.0f);
  assert(c.border_weight == 0.0f);
  assert(c.max_sectors == 1);
  assert(c.fill_color[0] == 1.0f && c.fill_color[1] == 0.0f && c.fill_color[2] == 0.5f);

  p.max_sectors = static_cast<std::size_t>(-5);
  assert(clamp_parameters(p).max_sectors == MAX_SECTOR_LIMIT);
}

void test_sector_limit_parsing()
{
  std::cout << "Testing sector limit parsing..." << std::endl;
  assert(parse_sector_limit("1") == std::size_t{1});
  assert(parse_sector_limit("250") == std::size_t{250});
  assert(parse_sector_limit(std::to_string(MAX_SECTOR_LIMIT)) == MAX_SECTOR_LIMIT);

  assert(!parse_sector_limit("0").has_value());
  assert(!parse_sector_limit("-5").has_value());
  assert(!parse_sector_limit("inf").has_value());
  assert(!parse_sector_limit("1e30").has_value());
  assert(!parse_sector_limit("2.5").has_value());
  assert(!parse_sector_limit("").has_value());
  assert(!parse_sector_limit("99999999999999999999999").has_value());
  assert(!parse_sector_limit(std::to_string(MAX_SECTOR_LIMIT + 1)).has_value());
}

static auto load_max_sectors(const std::string &value) -> std::size_t
{
  auto path = temp_file("max_sectors.json");
  {
    std::ofstream out(path);
    out << R"({"sector": {"max_sectors": )" << value << "}}";
  }
  persistence::workspace_t loaded;
  bool ok = persistence::load_workspace(path.string(), loaded);
  fs::remove(path);
  assert(ok);
  return loaded.sector.max_sectors;
}

void test_workspace_sector_limit()
{
  std::cout << "Testing workspace sector limit..." << std::endl;
  assert(load_max_sectors("40") == 40);
  assert(load_max_sectors("-5") == 1);
  assert(load_max_sectors("0") == 1);
  assert(load_max_sectors("18446744073709551615") == MAX_SECTOR_LIMIT);
  assert(load_max_sectors("1e30") == MAX_SECTOR_LIMIT);
  assert(load_max_sectors("12.9") == 12);

  auto path = temp_file("max_sectors_text.json");
  {
    std::ofstream out(path);
    out << R"({"sector": {"max_sectors": "lots"}})";
  }
  persistence::workspace_t ws;
  assert(!persistence::load_workspace(path.string(), ws));
  fs::remove(path);
}

void test_workspace_round_trip()
{
  std::cout << "Testing workspace save/load..." << std::endl;
  auto path = temp_file("workspace.json");

  persistence::workspace_t ws;
  ws.camera = {51.5, -0.12, 15.5};
  ws.sector.radius_m = 750.0;
  ws.sector.fill_opacity = 0.25f;
  ws.sector.fill_color = *parse_hex_color("#ff8800");
  ws.sector.border_weight = 2.0f;
  ws.sector.max_sectors = 40;
  ws.data.csv_file = "antennas.csv";
  ws.data.map_source = 1;

  assert(persistence::save_workspace(path.string(), ws));

  persistence::workspace_t loaded;
  assert(persistence::load_workspace(path.string(), loaded));
  fs::remove(path);

  assert(loaded.camera.lat == 51.5);
  assert(loaded.camera.lon == -0.12);
  assert(loaded.camera.zoom == 15.5);
  assert(loaded.sector.radius_m == 750.0);
  assert(loaded.sector.fill_opacity == 0.25f);
  assert(to_hex_color(loaded.sector.fill_color) == "#ff8800");
  assert(to_hex_color(loaded.sector.border_color) == "#000000");
  assert(loaded.sector.border_weight == 2.0f);
  assert(loaded.sector.max_sectors == 40);
  assert(loaded.data.csv_file == "antennas.csv");
  assert(loaded.data.map_source == 1);
}

void test_workspace_defaults_and_errors()
{
  std::cout << "Testing workspace defaults and errors..." << std::endl;
  persistence::workspace_t ws;
  assert(!persistence::load_workspace(temp_file("does_not_exist.json").string(), ws));

  auto broken = temp_file("broken.json");
  {
    std::ofstream out(broken);
    out << "{ \"camera\": ";
  }
  assert(!persistence::load_workspace(broken.string(), ws));
  fs::remove(broken);

  auto wrong_type = temp_file("wrong_type.json");
  {
    std::ofstream out(wrong_type);
    out << R"({"sector": {"radius_m": "far"}})";
  }
  assert(!persistence::load_workspace(wrong_type.string(), ws));
  fs::remove(wrong_type);

  // Partial file: missing keys keep defaults, bad colors fall back
  auto partial = temp_file("partial.json");
  {
    std::ofstream out(partial);
    out << R"({"sector": {"radius_m": 1200, "fill_color": "not-a-color", "fill_opacity": 7}})";
  }
  persistence::workspace_t loaded;
  assert(persistence::load_workspace(partial.string(), loaded));
  fs::remove(partial);
  assert(loaded.sector.radius_m == 1200.0);
  assert(to_hex_color(loaded.sector.fill_color) == "#3388ff");
  assert(loaded.sector.fill_opacity == 1.0f);
  assert(loaded.sector.max_sectors == 100);
  assert(loaded.camera.zoom == 14.0);
}

void test_geojson()
{
  std::cout << "Testing GeoJSON export..." << std::endl;
  antenna_record_t record;
  record.enodeb_id = "1001";
  record.cell_id = "11";
  record.latitude = -33.8688;
  record.longitude = 151.2093;
  record.azimuth = 120.0;
  record.beamwidth = 65.0;
  record.row_index = 3;

  sector_parameters_t params;
  auto batch = build_sectors({record}, params);
  assert(batch.sectors.size() == 1);

  auto j = persistence::to_geojson(batch.sectors, params);
  assert(j["type"] == "FeatureCollection");
  assert(j["features"].size() == 1);

  const auto &feature = j["features"][0];
  assert(feature["type"] == "Feature");
  assert(feature["geometry"]["type"] == "Polygon");
  assert(feature["properties"]["enodeb_id"] == "1001");
  assert(feature["properties"]["cell_id"] == "11");
  assert(feature["properties"]["row"] == 3);
  assert(feature["properties"]["fill"] == "#3388ff");
  assert(feature["properties"]["stroke"] == "#000000");
  assert(feature["properties"]["fill-opacity"].get<double>() == 0.5);

  const auto &ring = feature["geometry"]["coordinates"][0];
  assert(ring.size() == batch.sectors[0].polygon.size());
  // [lon, lat] order, closed ring
  assert(ring[0][0].get<double>() == 151.2093);
  assert(ring[0][1].get<double>() == -33.8688);
  assert(ring[0] == ring[ring.size() - 1]);

  auto path = temp_file("sectors.geojson");
  assert(persistence::export_geojson(path.string(), batch.sectors, params));
  std::ifstream in(path);
  auto reread = nlohmann::json::parse(in);
  in.close();
  fs::remove(path);
  assert(reread == j);

  assert(!persistence::export_geojson("/nonexistent/dir/out.geojson", batch.sectors, params));
}

int main()
{
  test_hex_colors();
  test_clamp_parameters();
  test_sector_limit_parsing();
  test_workspace_sector_limit();
  test_workspace_round_trip();
  test_workspace_defaults_and_errors();
  test_geojson();
  std::cout << "Persistence Verification Passed" << std::endl;
  return 0;
}
