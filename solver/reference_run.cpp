#include "solver/reference_run.hpp"

#include <iomanip>
#include <sstream>

#include "glog/logging.h"

namespace solver {

ReferenceScore ScoreReference(InferenceServer* server,
                              const util::CsvTable& reference) {
  size_t id_col = reference.Column("id");
  size_t problem_col = reference.Column("problem");
  size_t answer_col = reference.Column("answer");
  ReferenceScore score;
  for (const auto& row : reference.rows) {
    int64_t expected = std::stoll(row[answer_col]);
    int64_t predicted = server->Predict(row[problem_col]);
    bool correct = predicted == expected;
    if (correct) score.correct++;
    score.total++;
    LOG(INFO) << (correct ? "[ok]   " : "[fail] ") << row[id_col]
              << " predicted " << predicted << ", expected " << expected;
  }
  return score;
}

std::string FormatScore(const ReferenceScore& score) {
  double percent =
      score.total == 0 ? 0.0 : 100.0 * score.correct / score.total;
  std::ostringstream out;
  out << "Score: " << score.correct << "/" << score.total << " ("
      << std::fixed << std::setprecision(1) << percent << "%)";
  return out.str();
}

}  // namespace solver
