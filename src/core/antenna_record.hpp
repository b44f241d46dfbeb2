#pragma once

#include <cstddef>
#include <string>

namespace sector_mapper
{

// One antenna row from a record source. Identifiers are carried for display only.
struct antenna_record_t
{
  std::string enodeb_id;
  std::string cell_id;
  double latitude = 0.0;  // degrees, [-90, 90]
  double longitude = 0.0; // degrees, [-180, 180]
  double azimuth = 0.0;   // degrees clockwise from true north
  double beamwidth = 0.0; // horizontal beamwidth in degrees
  std::size_t row_index = 0;
};

// A record that could not be turned into a sector
struct record_issue_t
{
  std::size_t row_index = 0;
  std::string message;
};

} // namespace sector_mapper
