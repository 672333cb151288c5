#ifndef SOLVER_REFERENCE_RUN_HPP
#define SOLVER_REFERENCE_RUN_HPP

#include <string>

#include "solver/inference_server.hpp"
#include "util/csv.hpp"

namespace solver {

struct ReferenceScore {
  int64_t correct = 0;
  int64_t total = 0;
};

// Drives the server in-process over problems with known answers (columns
// id,problem,answer), logging every prediction.
ReferenceScore ScoreReference(InferenceServer* server,
                              const util::CsvTable& reference);

// "Score: correct/total (pct%)", with one decimal digit.
std::string FormatScore(const ReferenceScore& score);

}  // namespace solver

#endif
