#ifndef GATEWAY_PROBLEM_SET_HPP
#define GATEWAY_PROBLEM_SET_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/csv.hpp"

namespace gateway {

class invalid_results : public std::runtime_error {
 public:
  explicit invalid_results(const std::string& msg) : std::runtime_error(msg) {}
};

struct Problem {
  std::string id;
  std::string statement;
};

struct ResultRow {
  std::string id;
  int64_t answer;
};

// Reads problems from a table with columns id,problem. Duplicate or empty
// ids are rejected with csv_error.
std::vector<Problem> ParseProblems(const util::CsvTable& table);
std::vector<Problem> LoadProblems(const std::string& path);

// Checks that rows hold exactly one in-range answer per problem, in the
// problems' order. Throws invalid_results.
void ValidateResults(const std::vector<Problem>& problems,
                     const std::vector<ResultRow>& rows);

// Formats rows as an id,answer table.
std::string FormatResults(const std::vector<ResultRow>& rows);

}  // namespace gateway

#endif
