#pragma once

#include "antenna_record.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace sector_mapper
{

inline const std::array<const char *, 6> REQUIRED_COLUMNS = {"ENODEB_ID", "CELL_ID", "LONGITUDE", "LATITUDE", "AZIMUTH", "BEAMWIDTH_H"};

constexpr std::size_t PREVIEW_ROW_COUNT = 5;

struct antenna_load_result_t
{
  // Blocking failure (unreadable file, missing columns). Empty on success.
  std::string error;
  std::vector<std::string> missing_columns;

  std::vector<antenna_record_t> records;
  std::vector<record_issue_t> issues; // malformed rows, skipped
  std::size_t dropped_rows = 0;       // rows with an empty required field

  // Raw view for the data preview
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> preview;

  auto ok() const -> bool
  {
    return error.empty();
  }
};

class antenna_csv_t
{
public:
  static auto load(const std::string &path) -> antenna_load_result_t;
  static auto parse(std::istream &input) -> antenna_load_result_t;

  // Splits the next CSV record (which may span lines inside quotes). False at end of input.
  static auto read_record(std::istream &input, std::vector<std::string> &fields) -> bool;

  // Whole-field numeric parse; surrounding whitespace is allowed
  static auto parse_number(const std::string &text, double &out) -> bool;

  static auto required_columns_text() -> std::string;
};

} // namespace sector_mapper
