#include "../core/sector_batch.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace sector_mapper;

static antenna_record_t make_record(size_t row, double lat, double lon, double az, double bw)
{
  antenna_record_t r;
  r.enodeb_id = "ENB" + std::to_string(row / 3);
  r.cell_id = std::to_string(row % 3 + 1);
  r.latitude = lat;
  r.longitude = lon;
  r.azimuth = az;
  r.beamwidth = bw;
  r.row_index = row;
  return r;
}

static std::vector<antenna_record_t> make_grid(size_t count)
{
  std::vector<antenna_record_t> records;
  for (size_t i = 0; i < count; ++i)
  {
    records.push_back(make_record(i, -33.8 + 0.001 * static_cast<double>(i), 151.2, static_cast<double>((i % 3) * 120), 65.0));
  }
  return records;
}

void test_render_cap()
{
  std::cout << "Testing sector cap..." << std::endl;
  auto records = make_grid(150);
  sector_parameters_t params;
  assert(params.max_sectors == 100);

  auto batch = build_sectors(records, params);
  assert(batch.sectors.size() == 100);
  assert(batch.capped == 50);
  assert(batch.failures.empty());
  for (size_t i = 0; i < batch.sectors.size(); ++i)
  {
    assert(batch.sectors[i].record.row_index == i);
  }
}

void test_matches_engine()
{
  std::cout << "Testing batch output against direct calls..." << std::endl;
  // Large enough to take the multi-task path
  auto records = make_grid(300);
  sector_parameters_t params;
  params.max_sectors = 1000;
  params.radius_m = 450.0;

  auto batch = build_sectors(records, params);
  assert(batch.sectors.size() == 300);
  assert(batch.capped == 0);

  for (size_t i = 0; i < records.size(); ++i)
  {
    const auto &r = records[i];
    auto expected = compute_sector_polygon(r.latitude, r.longitude, r.azimuth, r.beamwidth, params.radius_m);
    const auto &got = batch.sectors[i].polygon;
    assert(got.size() == expected.size());
    for (size_t k = 0; k < got.size(); ++k)
    {
      assert(got[k].lat == expected[k].lat && got[k].lon == expected[k].lon);
    }
  }
}

void test_failures_are_partitioned()
{
  std::cout << "Testing failure partitioning..." << std::endl;
  std::vector<antenna_record_t> records;
  records.push_back(make_record(0, 10.0, 10.0, 0.0, 60.0));
  records.push_back(make_record(1, 95.0, 10.0, 0.0, 60.0)); // bad latitude
  records.push_back(make_record(2, 10.0, 10.0, 90.0, 0.0)); // bad beamwidth
  records.push_back(make_record(3, 10.0, 10.0, 180.0, 5.0));

  sector_parameters_t params;
  auto batch = build_sectors(records, params);
  assert(batch.sectors.size() == 2);
  assert(batch.failures.size() == 2);
  assert(batch.sectors[0].record.row_index == 0);
  assert(batch.sectors[1].record.row_index == 3);
  assert(batch.failures[0].row_index == 1);
  assert(batch.failures[1].row_index == 2);
  assert(batch.failures[0].message.rfind("Error plotting row 1: ", 0) == 0);
  std::cout << "  " << batch.failures[1].message << std::endl;

  // An invalid radius rejects every record without throwing
  params.radius_m = 0.0;
  auto rejected = build_sectors(records, params);
  assert(rejected.sectors.empty());
  assert(rejected.failures.size() == 4);
}

void test_tooltip()
{
  std::cout << "Testing tooltip text..." << std::endl;
  auto r = make_record(4, 1.0, 2.0, 120.0, 65.5);
  assert(make_tooltip(r) == "ENodeB: ENB1\nCell ID: 2\nAzimuth: 120.0\nBeamwidth: 65.5");

  auto whole = make_record(0, 1.0, 2.0, 0.0, 1e-3);
  assert(make_tooltip(whole) == "ENodeB: ENB0\nCell ID: 1\nAzimuth: 0.0\nBeamwidth: 0.001");
}

void test_view_center()
{
  std::cout << "Testing view center..." << std::endl;
  assert(!compute_view_center({}).has_value());

  std::vector<antenna_record_t> records = {make_record(0, 10.0, 20.0, 0, 60), make_record(1, 20.0, 40.0, 0, 60), make_record(2, 30.0, 60.0, 0, 60)};
  auto center = compute_view_center(records);
  assert(center.has_value());
  assert(std::abs(center->lat - 20.0) < 1e-12);
  assert(std::abs(center->lon - 40.0) < 1e-12);
}

void test_empty_batch()
{
  std::cout << "Testing empty batch..." << std::endl;
  auto batch = build_sectors({}, sector_parameters_t{});
  assert(batch.sectors.empty());
  assert(batch.failures.empty());
  assert(batch.capped == 0);
}

int main()
{
  test_render_cap();
  test_matches_engine();
  test_failures_are_partitioned();
  test_tooltip();
  test_view_center();
  test_empty_batch();
  std::cout << "Sector Batch Verification Passed" << std::endl;
  return 0;
}
