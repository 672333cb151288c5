#ifndef GATEWAY_ORDERING_HPP
#define GATEWAY_ORDERING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace gateway {

// RANDOM draws a fresh permutation for every run (public runs). FIXED always
// yields the same permutation for a given seed (private runs), so repeated
// submissions cannot probe the order.
enum class OrderMode { RANDOM, FIXED };

// Accepts "random" or "fixed". Throws std::invalid_argument.
OrderMode ParseOrderMode(const std::string& name);
const char* OrderModeName(OrderMode mode);

// Returns a permutation of 0..n-1. The seed is only used by FIXED.
std::vector<size_t> EvaluationOrder(size_t n, OrderMode mode, uint64_t seed);

// Fisher-Yates driven by mt19937_64. Only the raw engine output is used, so
// the result does not depend on the standard library.
std::vector<size_t> SeededPermutation(size_t n, uint64_t seed);

}  // namespace gateway

#endif
