#include "antenna_csv.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <iterator>
#include <iostream>

namespace sector_mapper
{

static auto trim(const std::string &s) -> std::string
{
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return {};
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

// Empty cells and the usual missing-value markers count as absent
static auto is_missing(const std::string &cell) -> bool
{
  static const char *markers[] = {"", "NA", "N/A", "NaN", "nan", "NULL", "null", "None"};
  std::string t = trim(cell);
  return std::any_of(std::begin(markers), std::end(markers), [&](const char *m) { return t == m; });
}

auto antenna_csv_t::read_record(std::istream &input, std::vector<std::string> &fields) -> bool
{
  fields.clear();
  if (input.peek() == std::char_traits<char>::eof())
    return false;

  std::string field;
  bool in_quotes = false;
  char c;
  while (input.get(c))
  {
    if (in_quotes)
    {
      if (c == '"')
      {
        // "" is an escaped quote
        if (input.peek() == '"')
        {
          input.get(c);
          field.push_back('"');
        }
        else
        {
          in_quotes = false;
        }
      }
      else
      {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"')
    {
      in_quotes = true;
    }
    else if (c == ',')
    {
      fields.push_back(std::move(field));
      field.clear();
    }
    else if (c == '\n')
    {
      break;
    }
    else if (c != '\r')
    {
      field.push_back(c);
    }
  }

  fields.push_back(std::move(field));
  return true;
}

auto antenna_csv_t::parse_number(const std::string &text, double &out) -> bool
{
  std::string t = trim(text);
  if (!t.empty() && t.front() == '+')
    t.erase(0, 1);
  if (t.empty())
    return false;

  const char *first = t.data();
  const char *last = t.data() + t.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

auto antenna_csv_t::required_columns_text() -> std::string
{
  std::string text;
  for (const auto *col : REQUIRED_COLUMNS)
  {
    if (!text.empty())
      text += ", ";
    text += col;
  }
  return text;
}

auto antenna_csv_t::load(const std::string &path) -> antenna_load_result_t
{
  std::ifstream file(path);
  if (!file.is_open())
  {
    std::cerr << "CSV: Failed to open " << path << std::endl;
    antenna_load_result_t result;
    result.error = "Error reading file: " + path;
    return result;
  }
  return parse(file);
}

auto antenna_csv_t::parse(std::istream &input) -> antenna_load_result_t
{
  antenna_load_result_t result;

  std::vector<std::string> fields;
  if (!read_record(input, fields) || (fields.size() == 1 && trim(fields[0]).empty()))
  {
    result.error = "Error reading file: no header row";
    return result;
  }

  for (const auto &f : fields)
  {
    result.columns.push_back(trim(f));
  }
  // Tolerate a UTF-8 byte order mark on the first column name
  if (!result.columns.empty() && result.columns[0].rfind("\xEF\xBB\xBF", 0) == 0)
  {
    result.columns[0].erase(0, 3);
  }

  // Resolve required column positions
  std::array<size_t, REQUIRED_COLUMNS.size()> column_pos{};
  for (size_t i = 0; i < REQUIRED_COLUMNS.size(); ++i)
  {
    auto it = std::find(result.columns.begin(), result.columns.end(), REQUIRED_COLUMNS[i]);
    if (it == result.columns.end())
    {
      result.missing_columns.emplace_back(REQUIRED_COLUMNS[i]);
      continue;
    }
    column_pos[i] = static_cast<size_t>(std::distance(result.columns.begin(), it));
  }

  if (!result.missing_columns.empty())
  {
    std::string list;
    for (const auto &col : result.missing_columns)
    {
      if (!list.empty())
        list += ", ";
      list += col;
    }
    result.error = "Missing required columns in CSV: " + list;
    return result;
  }

  enum column_t
  {
    ENODEB_ID,
    CELL_ID,
    LONGITUDE,
    LATITUDE,
    AZIMUTH,
    BEAMWIDTH_H
  };

  size_t row_index = 0;
  while (read_record(input, fields))
  {
    // Skip blank lines entirely
    if (fields.size() == 1 && trim(fields[0]).empty())
      continue;

    const size_t row = row_index++;

    if (result.preview.size() < PREVIEW_ROW_COUNT)
    {
      result.preview.push_back(fields);
    }

    bool complete = true;
    for (size_t col : column_pos)
    {
      if (col >= fields.size() || is_missing(fields[col]))
      {
        complete = false;
        break;
      }
    }
    if (!complete)
    {
      result.dropped_rows++;
      continue;
    }

    antenna_record_t record;
    record.row_index = row;
    record.enodeb_id = trim(fields[column_pos[ENODEB_ID]]);
    record.cell_id = trim(fields[column_pos[CELL_ID]]);

    struct numeric_field_t
    {
      column_t column;
      double *target;
    };
    const numeric_field_t numeric_fields[] = {
        {LATITUDE, &record.latitude}, {LONGITUDE, &record.longitude}, {AZIMUTH, &record.azimuth}, {BEAMWIDTH_H, &record.beamwidth}};

    std::string bad_field;
    for (const auto &nf : numeric_fields)
    {
      if (!parse_number(fields[column_pos[nf.column]], *nf.target))
      {
        bad_field = std::format("{} value '{}' is not a number", REQUIRED_COLUMNS[nf.column], trim(fields[column_pos[nf.column]]));
        break;
      }
    }

    if (!bad_field.empty())
    {
      result.issues.push_back({row, std::format("Malformed row {}: {}", row, bad_field)});
      continue;
    }

    result.records.push_back(std::move(record));
  }

  std::cout << "CSV: " << result.records.size() << " records, " << result.dropped_rows << " dropped, " << result.issues.size() << " malformed" << std::endl;
  return result;
}

} // namespace sector_mapper
