#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Common flags
DECLARE_string(address);
DECLARE_int64(grace_period_ms);

// Gateway-only flags
DECLARE_string(input);
DECLARE_string(output);
DECLARE_string(records);
DECLARE_int64(deadline_ms);
DECLARE_string(order);
DECLARE_uint64(order_seed);

// Solver-only flags
DECLARE_string(model);
DECLARE_string(reference);

namespace util {

// Environment variable that overrides the default of --address.
static const constexpr char* kAddressEnv = "EVALRELAY_ADDRESS";
// Set to a true value when the run is scored.
static const constexpr char* kScoredRunEnv = "KAGGLE_IS_COMPETITION_RERUN";

// Applies environment overrides to flags left at their default value.
void ApplyEnvironment();

// Interprets an environment variable as a boolean ("1", "true", "yes").
bool EnvFlag(const char* name);

}  // namespace util

#endif
