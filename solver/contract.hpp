#ifndef SOLVER_CONTRACT_HPP
#define SOLVER_CONTRACT_HPP

#include <algorithm>
#include <cstdint>

// What the gateway and the solver agree on, besides proto/solver.proto.
namespace solver {

static const constexpr char* kPredictEndpoint = "predict";
// Called by the gateway when the run is over; the solver then exits.
static const constexpr char* kShutdownEndpoint = "shutdown";
static const constexpr int64_t kMinAnswer = 0;
static const constexpr int64_t kMaxAnswer = 99999;
// Recorded for problems that were not answered.
static const constexpr int64_t kDefaultAnswer = 0;

inline int64_t ClampAnswer(int64_t answer) {
  return std::max(kMinAnswer, std::min(kMaxAnswer, answer));
}

}  // namespace solver

#endif
