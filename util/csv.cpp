#include "util/csv.hpp"

#include <algorithm>

namespace util {

namespace {

std::string QuoteField(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  return quoted + '"';
}

}  // namespace

size_t CsvTable::Column(const std::string& name) const {
  auto it = std::find(header.begin(), header.end(), name);
  if (it == header.end()) throw csv_error("Missing column " + name);
  return it - header.begin();
}

bool CsvTable::HasColumn(const std::string& name) const {
  return std::find(header.begin(), header.end(), name) != header.end();
}

CsvTable ParseCsv(const std::string& text) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool quoted = false;
  bool field_started = false;
  size_t line = 1;
  size_t pos = 0;
  // UTF-8 byte order mark.
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

  auto end_record = [&]() {
    record.push_back(std::move(field));
    field.clear();
    field_started = false;
    // Blank lines carry no data.
    if (record.size() > 1 || !record[0].empty()) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (; pos < text.size(); pos++) {
    char c = text[pos];
    if (quoted) {
      if (c == '"') {
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
          field += '"';
          pos++;
        } else {
          quoted = false;
        }
      } else {
        if (c == '\n') line++;
        field += c;
      }
      continue;
    }
    switch (c) {
      case '"':
        if (field_started) {
          throw csv_error("Unexpected quote on line " + std::to_string(line));
        }
        quoted = true;
        field_started = true;
        break;
      case ',':
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
        break;
      case '\r':
        if (pos + 1 < text.size() && text[pos + 1] == '\n') break;
        end_record();
        line++;
        break;
      case '\n':
        end_record();
        line++;
        break;
      default:
        field += c;
        field_started = true;
    }
  }
  if (quoted) {
    throw csv_error("Unterminated quoted field on line " +
                    std::to_string(line));
  }
  if (field_started || !record.empty()) end_record();

  CsvTable table;
  if (records.empty()) return table;
  table.header = std::move(records[0]);
  for (size_t i = 1; i < records.size(); i++) {
    if (records[i].size() != table.header.size()) {
      throw csv_error("Row " + std::to_string(i) + " has " +
                      std::to_string(records[i].size()) + " fields, expected " +
                      std::to_string(table.header.size()));
    }
    table.rows.push_back(std::move(records[i]));
  }
  return table;
}

std::string FormatCsvRow(const std::vector<std::string>& fields) {
  std::string row;
  for (size_t i = 0; i < fields.size(); i++) {
    if (i) row += ',';
    row += QuoteField(fields[i]);
  }
  return row + '\n';
}

}  // namespace util
