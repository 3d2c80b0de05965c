#pragma once
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "core/decay.h"
#include "core/point.h"

namespace core {

// Summary of a bounded set of nearby points.
//
// The kind tag selects how members are weighted; center/radius/weight take the
// evaluation time for both kinds so callers never need to know which one they hold.
// Derived quantities are recomputed on every call: decay makes them time dependent.
template <typename T>
class MicroCluster {
public:
  using SimilarityPtr = std::shared_ptr<const Similarity<T>>;

  MicroCluster(MicroClusterKind kind, SimilarityPtr similarity, double lambda = 0.0)
    : kind_(kind), similarity_(std::move(similarity)), lambda_(lambda) {}

  MicroCluster(MicroClusterKind kind, SimilarityPtr similarity, double lambda,
               std::vector<T> points)
    : kind_(kind), similarity_(std::move(similarity)), lambda_(lambda),
      points_(std::move(points)) {}

  void insert(const T& p) { points_.push_back(p); }

  // Removes every member carrying this identity. Returns the number removed.
  size_t remove(const std::string& id) {
    const size_t before = points_.size();
    points_.erase(std::remove_if(points_.begin(), points_.end(),
                                 [&](const T& p) { return p.id() == id; }),
                  points_.end());
    return before - points_.size();
  }

  // Drops the most recently inserted member (undo of a rejected insert).
  void popLast() {
    if (!points_.empty()) points_.pop_back();
  }

  double weight(double t) const {
    if (kind_ == MicroClusterKind::Timeless) return static_cast<double>(points_.size());
    double w = 0.0;
    for (const auto& p : points_) w += decay_weight(lambda_, t, p.timestamp());
    return w;
  }

  T center(double t) const {
    return T::centroid(points_, memberWeights(t));
  }

  // Timeless: max distance from the centroid to any member.
  // Temporal: weighted RMS distance from the decayed centroid.
  float radius(double t) const {
    if (points_.empty()) return 0.0f;
    const auto weights = memberWeights(t);
    const T c = T::centroid(points_, weights);
    const auto& sim = *similarity_;

    if (kind_ == MicroClusterKind::Timeless) {
      float r = 0.0f;
      for (const auto& p : points_) r = std::max(r, sim(c, p));
      return r;
    }

    double sw = 0.0, sd = 0.0;
    for (size_t i = 0; i < points_.size(); ++i) {
      const double d = sim(c, points_[i]);
      sd += weights[i] * d * d;
      sw += weights[i];
    }
    if (sw <= 0.0) return 0.0f;
    return static_cast<float>(std::sqrt(sd / sw));
  }

  // Temporal micro-clusters are potential-core while their decayed weight holds
  // the threshold, outliers otherwise. Timeless ones are always potential-core.
  bool isPotentialCore(double t, double weight_threshold) const {
    if (kind_ == MicroClusterKind::Timeless) return true;
    return weight(t) >= weight_threshold;
  }

  MicroCluster merge(const MicroCluster& other) const {
    std::vector<T> pts = points_;
    pts.insert(pts.end(), other.points_.begin(), other.points_.end());
    return MicroCluster(kind_, similarity_, lambda_, std::move(pts));
  }

  bool contains(const std::string& id) const {
    return std::any_of(points_.begin(), points_.end(),
                       [&](const T& p) { return p.id() == id; });
  }

  const std::vector<T>& points() const { return points_; }
  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }
  MicroClusterKind kind() const { return kind_; }

private:
  std::vector<double> memberWeights(double t) const {
    std::vector<double> w(points_.size(), 1.0);
    if (kind_ == MicroClusterKind::Temporal) {
      for (size_t i = 0; i < points_.size(); ++i)
        w[i] = decay_weight(lambda_, t, points_[i].timestamp());
    }
    return w;
  }

  MicroClusterKind kind_;
  SimilarityPtr similarity_;
  double lambda_{0.0};
  std::vector<T> points_;
};

} // namespace core
