#ifndef UTIL_CSV_HPP
#define UTIL_CSV_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace util {

class csv_error : public std::runtime_error {
 public:
  explicit csv_error(const std::string& msg) : std::runtime_error(msg) {}
};

// A comma-separated table with a header row. Fields may be quoted, with ""
// standing for a literal quote; quoted fields may span lines.
struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  // Returns the index of the named column, throws csv_error if missing.
  size_t Column(const std::string& name) const;
  bool HasColumn(const std::string& name) const;
};

// Throws csv_error on unterminated quotes or rows whose width differs from
// the header's.
CsvTable ParseCsv(const std::string& text);

// Formats one row, quoting fields only when needed. Ends with a newline.
std::string FormatCsvRow(const std::vector<std::string>& fields);

}  // namespace util

#endif
