#include "util/flags.hpp"

#include <ctype.h>
#include <stdlib.h>

#include <algorithm>
#include <string>

DEFINE_string(address, "unix:/tmp/evalrelay.sock",
              "Relay address, either unix:/path or host:port. Defaults to "
              "$EVALRELAY_ADDRESS when set");
DEFINE_int64(grace_period_ms, 900000,
             "How long to wait for the other process to start listening");

DEFINE_string(input, "test.csv", "Problems to serve, with columns id,problem");
DEFINE_string(output, "submission.csv",
              "Where the id,answer result set is written");
DEFINE_string(records, "",
              "If set, where the per-call records are written for diagnostics");
DEFINE_int64(deadline_ms, 360000, "Time allowed to answer a single problem");
DEFINE_string(order, "random",
              "Evaluation order: random (public runs) or fixed (private runs)");
DEFINE_uint64(order_seed, 0, "Seed of the fixed evaluation order");

DEFINE_string(model, "",
              "Reference table id,problem,answer loaded once by the solver");
DEFINE_string(reference, "reference.csv",
              "Problems with known answers used by local debug runs");

namespace util {

void ApplyEnvironment() {
  const char* address = getenv(kAddressEnv);
  if (address != nullptr && *address != '\0' &&
      gflags::GetCommandLineFlagInfoOrDie("address").is_default) {
    FLAGS_address = address;
  }
}

bool EnvFlag(const char* name) {
  const char* value = getenv(name);
  if (value == nullptr) return false;
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
    return static_cast<char>(tolower(static_cast<unsigned char>(c)));
  });
  return lower == "1" || lower == "true" || lower == "yes";
}

}  // namespace util
