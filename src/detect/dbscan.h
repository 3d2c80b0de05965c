#pragma once

#include <cstddef>
#include <functional>
#include <vector>

// Labelling of density units produced by one DBSCAN pass.
struct DbscanResult {
  static constexpr int kNoise = -2;

  std::vector<int> labels;   // per unit: cluster id >= 0, or kNoise
  int cluster_count{0};
  size_t core_count{0};
  size_t noise_count{0};
};

// DBSCAN over micro-clusters.
//
// A unit is one micro-cluster, represented by its center. Units i and j are
// directly connected when dist(i, j) <= eps. Unit i is core when at least
// minPts OTHER units are connected to it, or when the summed weight of its
// eps-neighbourhood (itself included) reaches minPts. The weighted rule lets a
// single dense micro-cluster stand as a cluster on its own.
class MicroClusterDBSCAN {
  float eps_; int minPts_;

public:
  using Distance = std::function<float(size_t, size_t)>;

  MicroClusterDBSCAN(float eps, int minPts): eps_(eps), minPts_(minPts) {}

  void setParams(float eps, int minPts){ eps_=eps; minPts_=minPts; }
  float eps() const { return eps_; }
  int minPts() const { return minPts_; }

  // weights.size() is the number of units; dist must be symmetric.
  DbscanResult run(const std::vector<double>& weights, const Distance& dist) const;
};
