#include "gateway/ordering.hpp"

#include <random>
#include <stdexcept>
#include <utility>

namespace gateway {

OrderMode ParseOrderMode(const std::string& name) {
  if (name == "random") return OrderMode::RANDOM;
  if (name == "fixed") return OrderMode::FIXED;
  throw std::invalid_argument("Unknown evaluation order " + name);
}

const char* OrderModeName(OrderMode mode) {
  return mode == OrderMode::FIXED ? "fixed" : "random";
}

std::vector<size_t> SeededPermutation(size_t n, uint64_t seed) {
  std::vector<size_t> order(n);
  for (size_t i = 0; i < n; i++) order[i] = i;
  std::mt19937_64 rng(seed);
  for (size_t i = n; i > 1; i--) {
    size_t j = rng() % i;
    std::swap(order[i - 1], order[j]);
  }
  return order;
}

std::vector<size_t> EvaluationOrder(size_t n, OrderMode mode, uint64_t seed) {
  if (mode == OrderMode::FIXED) return SeededPermutation(n, seed);
  std::random_device device;
  uint64_t fresh = (static_cast<uint64_t>(device()) << 32) ^ device();
  return SeededPermutation(n, fresh);
}

}  // namespace gateway
