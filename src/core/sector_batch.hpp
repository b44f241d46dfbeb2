#pragma once

#include "antenna_record.hpp"
#include "sector_geometry.hpp"
#include "sector_parameters.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sector_mapper
{

struct sector_t
{
  antenna_record_t record;
  geo_polygon_t polygon;
  std::string tooltip;
};

struct sector_batch_t
{
  std::vector<sector_t> sectors;        // input order preserved
  std::vector<record_issue_t> failures; // records the engine rejected
  std::size_t capped = 0;               // records beyond max_sectors, not attempted
};

// Records per std::async task. Small batches run on the calling thread.
constexpr std::size_t BATCH_CHUNK_SIZE = 64;

auto make_tooltip(const antenna_record_t &record) -> std::string;

// Maps each record (up to params.max_sectors) through the geometry engine
auto build_sectors(const std::vector<antenna_record_t> &records, const sector_parameters_t &params) -> sector_batch_t;

// Mean of all record coordinates, for the initial map view
auto compute_view_center(const std::vector<antenna_record_t> &records) -> std::optional<geo_point_t>;

} // namespace sector_mapper
