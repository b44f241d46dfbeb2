#include "../core/antenna_csv.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace sector_mapper;

static antenna_load_result_t parse_text(const std::string &text)
{
  std::istringstream in(text);
  return antenna_csv_t::parse(in);
}

void test_basic_load()
{
  std::cout << "Testing basic CSV..." << std::endl;
  auto result = parse_text("ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H\n"
                           "1001,11,151.2093,-33.8688,0,65\n"
                           "1001,12,151.2093,-33.8688,120,65\n"
                           "1002,21,151.2200,-33.8700,240.5,33\n");
  assert(result.ok());
  assert(result.records.size() == 3);
  assert(result.issues.empty());
  assert(result.dropped_rows == 0);
  assert(result.columns.size() == 6);

  const auto &r = result.records[2];
  assert(r.enodeb_id == "1002");
  assert(r.cell_id == "21");
  assert(r.longitude == 151.22);
  assert(r.latitude == -33.87);
  assert(r.azimuth == 240.5);
  assert(r.beamwidth == 33.0);
  assert(r.row_index == 2);
}

void test_column_order_and_extras()
{
  std::cout << "Testing column order and extra columns..." << std::endl;
  auto result = parse_text(" SITE_NAME , BEAMWIDTH_H,AZIMUTH,LATITUDE,LONGITUDE,CELL_ID,ENODEB_ID\r\n"
                           "Harbour,90,45,-33.85,151.21,7,500\r\n");
  assert(result.ok());
  assert(result.records.size() == 1);
  assert(result.columns[0] == "SITE_NAME");
  const auto &r = result.records[0];
  assert(r.beamwidth == 90.0);
  assert(r.azimuth == 45.0);
  assert(r.latitude == -33.85);
  assert(r.longitude == 151.21);
  assert(r.cell_id == "7");
  assert(r.enodeb_id == "500");
}

void test_missing_columns()
{
  std::cout << "Testing missing columns..." << std::endl;
  auto result = parse_text("ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE\n1,2,3,4\n");
  assert(!result.ok());
  assert(result.records.empty());
  assert(result.missing_columns.size() == 2);
  assert(result.missing_columns[0] == "AZIMUTH");
  assert(result.missing_columns[1] == "BEAMWIDTH_H");
  std::cout << "  " << result.error << std::endl;
  assert(result.error == "Missing required columns in CSV: AZIMUTH, BEAMWIDTH_H");
}

void test_dropped_rows()
{
  std::cout << "Testing rows with missing values..." << std::endl;
  auto result = parse_text("ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H,NOTE\n"
                           "1,1,10.0,50.0,0,60,ok\n"
                           "1,2,10.0,,120,60,no latitude\n"
                           "1,3,10.0,50.0,NaN,60,nan azimuth\n"
                           "1,4,10.0,50.0\n"
                           "\n"
                           "1,5,10.0,50.0,240,60,\n");
  assert(result.ok());
  assert(result.records.size() == 2);
  assert(result.dropped_rows == 3);
  assert(result.issues.empty());
  assert(result.records[0].cell_id == "1");
  assert(result.records[1].cell_id == "5");
  // Blank line is not a data row
  assert(result.records[1].row_index == 4);
}

void test_malformed_rows()
{
  std::cout << "Testing malformed rows..." << std::endl;
  auto result = parse_text("ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H\n"
                           "1,1,10.0,50.0,north,60\n"
                           "1,2,10.0,50.0,90,60\n"
                           "1,3,ten,50.0,90,60deg\n");
  assert(result.ok());
  assert(result.records.size() == 1);
  assert(result.records[0].cell_id == "2");
  assert(result.issues.size() == 2);
  assert(result.issues[0].row_index == 0);
  assert(result.issues[0].message.find("AZIMUTH") != std::string::npos);
  assert(result.issues[1].row_index == 2);
  assert(result.issues[1].message.find("LONGITUDE") != std::string::npos);
  std::cout << "  " << result.issues[0].message << std::endl;
}

void test_quoted_fields()
{
  std::cout << "Testing quoted fields..." << std::endl;
  auto result = parse_text("ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H\n"
                           "\"Site, North\",\"Cell \"\"A\"\"\",\"-0.12\",51.5,90,5\n"
                           "\"Multi\nLine\",B,-0.13,51.6,180,5\n");
  assert(result.ok());
  assert(result.records.size() == 2);
  assert(result.records[0].enodeb_id == "Site, North");
  assert(result.records[0].cell_id == "Cell \"A\"");
  assert(result.records[0].longitude == -0.12);
  assert(result.records[1].enodeb_id == "Multi\nLine");
  assert(result.records[1].azimuth == 180.0);
}

void test_preview_rows()
{
  std::cout << "Testing raw preview..." << std::endl;
  std::string text = "ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H\n";
  for (int i = 0; i < 12; ++i)
  {
    text += "9," + std::to_string(i) + ",0,0," + std::to_string(i * 30) + ",65\n";
  }
  auto result = parse_text(text);
  assert(result.records.size() == 12);
  assert(result.preview.size() == PREVIEW_ROW_COUNT);
  assert(result.preview[4][1] == "4");
}

void test_unreadable_input()
{
  std::cout << "Testing unreadable input..." << std::endl;
  auto empty = parse_text("");
  assert(!empty.ok());

  auto missing = antenna_csv_t::load("/nonexistent/dir/antennas.csv");
  assert(!missing.ok());
  assert(missing.error.rfind("Error reading file", 0) == 0);
}

void test_load_from_file()
{
  std::cout << "Testing load from disk..." << std::endl;
  auto path = std::filesystem::temp_directory_path() / "sector_mapper_verify_antennas.csv";
  {
    std::ofstream out(path);
    out << "\xEF\xBB\xBF"
        << "ENODEB_ID,CELL_ID,LONGITUDE,LATITUDE,AZIMUTH,BEAMWIDTH_H\n"
        << "77,1,2.35,48.85,300,65\n";
  }
  auto result = antenna_csv_t::load(path.string());
  std::filesystem::remove(path);
  assert(result.ok());
  assert(result.records.size() == 1);
  assert(result.records[0].enodeb_id == "77");
}

void test_parse_number()
{
  std::cout << "Testing numeric parsing..." << std::endl;
  double v = 0.0;
  assert(antenna_csv_t::parse_number("1.5", v) && v == 1.5);
  assert(antenna_csv_t::parse_number("  -2 ", v) && v == -2.0);
  assert(antenna_csv_t::parse_number("+3", v) && v == 3.0);
  assert(antenna_csv_t::parse_number("1e3", v) && v == 1000.0);
  assert(!antenna_csv_t::parse_number("1.5x", v));
  assert(!antenna_csv_t::parse_number("", v));
  assert(!antenna_csv_t::parse_number("   ", v));
  assert(!antenna_csv_t::parse_number("abc", v));
}

int main()
{
  test_basic_load();
  test_column_order_and_extras();
  test_missing_columns();
  test_dropped_rows();
  test_malformed_rows();
  test_quoted_fields();
  test_preview_rows();
  test_unreadable_input();
  test_load_from_file();
  test_parse_number();
  std::cout << "Antenna CSV Verification Passed" << std::endl;
  return 0;
}
