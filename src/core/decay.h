#pragma once
#include <algorithm>
#include <cmath>

namespace core {

enum class MicroClusterKind {
  Timeless,  // every member weighs 1
  Temporal   // members fade as 2^(-lambda * age)
};

// Fading weight of a point that arrived at t_arrival, observed at t_now.
// Negative ages (out of order arrivals) count as fresh.
inline double decay_weight(double lambda, double t_now, double t_arrival) {
  const double age = std::max(0.0, t_now - t_arrival);
  return std::exp2(-lambda * age);
}

} // namespace core
