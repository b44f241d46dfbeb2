#include "sector_batch.hpp"
#include <algorithm>
#include <format>
#include <future>

namespace sector_mapper
{

// Shortest form, but whole numbers keep a decimal: 120 -> "120.0", 65.5 -> "65.5"
static auto format_degrees(double value) -> std::string
{
  std::string text = std::format("{}", value);
  if (text.find_first_not_of("-0123456789") == std::string::npos)
    text += ".0";
  return text;
}

auto make_tooltip(const antenna_record_t &record) -> std::string
{
  return std::format("ENodeB: {}\nCell ID: {}\nAzimuth: {}\nBeamwidth: {}", record.enodeb_id, record.cell_id, format_degrees(record.azimuth), format_degrees(record.beamwidth));
}

auto build_sectors(const std::vector<antenna_record_t> &records, const sector_parameters_t &params) -> sector_batch_t
{
  sector_batch_t batch;

  const size_t count = std::min(records.size(), params.max_sectors);
  batch.capped = records.size() - count;
  if (count == 0)
    return batch;

  std::vector<sector_result_t> results(count);

  auto run_chunk = [&records, &params, &results](size_t begin, size_t end)
  {
    for (size_t i = begin; i < end; ++i)
    {
      results[i] = try_compute_sector_polygon(records[i], params);
    }
  };

  if (count <= BATCH_CHUNK_SIZE)
  {
    run_chunk(0, count);
  }
  else
  {
    // Each task owns a disjoint slice of results
    std::vector<std::future<void>> tasks;
    for (size_t begin = 0; begin < count; begin += BATCH_CHUNK_SIZE)
    {
      size_t end = std::min(begin + BATCH_CHUNK_SIZE, count);
      tasks.push_back(std::async(std::launch::async, run_chunk, begin, end));
    }
    for (auto &task : tasks)
    {
      task.get();
    }
  }

  for (size_t i = 0; i < count; ++i)
  {
    const auto &record = records[i];
    if (results[i].ok())
    {
      batch.sectors.push_back({record, std::move(*results[i].polygon), make_tooltip(record)});
    }
    else
    {
      batch.failures.push_back({record.row_index, std::format("Error plotting row {}: {}", record.row_index, results[i].error)});
    }
  }

  return batch;
}

auto compute_view_center(const std::vector<antenna_record_t> &records) -> std::optional<geo_point_t>
{
  if (records.empty())
    return std::nullopt;

  double lat_sum = 0.0;
  double lon_sum = 0.0;
  for (const auto &r : records)
  {
    lat_sum += r.latitude;
    lon_sum += r.longitude;
  }

  const double n = static_cast<double>(records.size());
  return geo_point_t{lat_sum / n, lon_sum / n};
}

} // namespace sector_mapper
