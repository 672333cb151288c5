#include "gateway/problem_set.hpp"

#include <set>

#include "solver/contract.hpp"
#include "util/file.hpp"

namespace gateway {

std::vector<Problem> ParseProblems(const util::CsvTable& table) {
  size_t id_col = table.Column("id");
  size_t problem_col = table.Column("problem");
  std::vector<Problem> problems;
  std::set<std::string> seen;
  for (const auto& row : table.rows) {
    const std::string& id = row[id_col];
    if (id.empty()) throw util::csv_error("Problem without an id");
    if (!seen.insert(id).second) {
      throw util::csv_error("Duplicate problem id " + id);
    }
    problems.push_back(Problem{id, row[problem_col]});
  }
  return problems;
}

std::vector<Problem> LoadProblems(const std::string& path) {
  return ParseProblems(util::ParseCsv(util::File::Read(path)));
}

void ValidateResults(const std::vector<Problem>& problems,
                     const std::vector<ResultRow>& rows) {
  if (rows.size() != problems.size()) {
    throw invalid_results("Expected " + std::to_string(problems.size()) +
                          " rows, got " + std::to_string(rows.size()));
  }
  for (size_t i = 0; i < rows.size(); i++) {
    if (rows[i].id != problems[i].id) {
      throw invalid_results("Row " + std::to_string(i) + " is " + rows[i].id +
                            ", expected " + problems[i].id);
    }
    if (rows[i].answer < solver::kMinAnswer ||
        rows[i].answer > solver::kMaxAnswer) {
      throw invalid_results("Answer " + std::to_string(rows[i].answer) +
                            " for " + rows[i].id + " out of range");
    }
  }
}

std::string FormatResults(const std::vector<ResultRow>& rows) {
  std::string out = util::FormatCsvRow({"id", "answer"});
  for (const ResultRow& row : rows) {
    out += util::FormatCsvRow({row.id, std::to_string(row.answer)});
  }
  return out;
}

}  // namespace gateway
