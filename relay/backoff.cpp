#include "relay/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace relay {

std::chrono::milliseconds Backoff::Next() {
  double delay = options_.initial.count() *
                 std::pow(std::max(options_.factor, 1.0), attempts_);
  attempts_++;
  double cap = static_cast<double>(options_.max.count());
  return std::chrono::milliseconds(
      std::max<int64_t>(1, static_cast<int64_t>(std::min(delay, cap))));
}

}  // namespace relay
