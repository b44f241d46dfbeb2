#include "core/antenna_csv.hpp"
#include "core/persistence.hpp"
#include "core/sector_batch.hpp"
#include "core/sector_parameters.hpp"
#include <cmath>
#include <iostream>
#include <string>

using namespace sector_mapper;

static void print_usage(const char *prog)
{
  std::cerr << "Usage: " << prog << " --input <csv> --output <geojson> [options]\n"
            << "Options:\n"
            << "  --input <path>     Antenna CSV (" << antenna_csv_t::required_columns_text() << ")\n"
            << "  --output <path>    GeoJSON file to write\n"
            << "  --radius <m>       Sector radius in meters (default: 300)\n"
            << "  --max <n>          Maximum number of sectors (default: 100)\n"
            << "  --color <#rrggbb>  Sector fill color (default: #3388ff)\n"
            << "  --help             Show this help\n";
}

int main(int argc, char *argv[])
{
  std::string input_path;
  std::string output_path;
  sector_parameters_t params;

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    double value = 0.0;
    if (arg == "--input" && i + 1 < argc)
    {
      input_path = argv[++i];
    }
    else if (arg == "--output" && i + 1 < argc)
    {
      output_path = argv[++i];
    }
    else if (arg == "--radius" && i + 1 < argc)
    {
      if (!antenna_csv_t::parse_number(argv[++i], value) || !std::isfinite(value) || value <= 0.0)
      {
        std::cerr << "Error: --radius must be a positive number\n";
        return 1;
      }
      params.radius_m = value;
    }
    else if (arg == "--max" && i + 1 < argc)
    {
      auto limit = parse_sector_limit(argv[++i]);
      if (!limit)
      {
        std::cerr << "Error: --max must be a whole number between 1 and " << MAX_SECTOR_LIMIT << "\n";
        return 1;
      }
      params.max_sectors = *limit;
    }
    else if (arg == "--color" && i + 1 < argc)
    {
      auto color = parse_hex_color(argv[++i]);
      if (!color)
      {
        std::cerr << "Error: --color must be a hex color like #3388ff\n";
        return 1;
      }
      params.fill_color = *color;
    }
    else if (arg == "--help")
    {
      print_usage(argv[0]);
      return 0;
    }
    else
    {
      std::cerr << "Error: Unknown or incomplete option " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  if (input_path.empty() || output_path.empty())
  {
    std::cerr << "Error: --input and --output are required\n";
    print_usage(argv[0]);
    return 1;
  }

  auto loaded = antenna_csv_t::load(input_path);
  if (!loaded.ok())
  {
    std::cerr << "Error: " << loaded.error << "\n";
    return 1;
  }

  for (const auto &issue : loaded.issues)
  {
    std::cerr << "Warning: " << issue.message << "\n";
  }
  if (loaded.dropped_rows > 0)
  {
    std::cerr << "Warning: " << loaded.dropped_rows << " rows dropped (missing values)\n";
  }

  auto batch = build_sectors(loaded.records, params);
  for (const auto &failure : batch.failures)
  {
    std::cerr << "Warning: " << failure.message << "\n";
  }
  if (batch.capped > 0)
  {
    std::cerr << "Warning: " << batch.capped << " records beyond the " << params.max_sectors << " sector limit were skipped\n";
  }

  if (!persistence::export_geojson(output_path, batch.sectors, params))
  {
    return 1;
  }

  return 0;
}
