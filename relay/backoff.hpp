#ifndef RELAY_BACKOFF_HPP
#define RELAY_BACKOFF_HPP

#include <chrono>

namespace relay {

struct BackoffOptions {
  std::chrono::milliseconds initial{100};
  double factor = 2.0;
  std::chrono::milliseconds max{5000};
};

// Bounded exponential backoff: initial, initial*factor, ... capped at max.
class Backoff {
 public:
  explicit Backoff(const BackoffOptions& options) : options_(options) {}

  // Returns the delay to wait before the next attempt.
  std::chrono::milliseconds Next();
  int Attempts() const { return attempts_; }

 private:
  BackoffOptions options_;
  int attempts_ = 0;
};

}  // namespace relay

#endif
