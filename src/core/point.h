#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * Stream element contract
 *
 * Every point type T handed to the clustering engine must provide:
 *   const std::string& id() const;       stable identity (removal key)
 *   double timestamp() const;            arrival time, read by temporal micro-clusters
 *   static T centroid(const std::vector<T>& points,
 *                     const std::vector<double>& weights);
 *                                        weighted mean of a non-empty set
 *
 * Distances come from a user supplied Similarity<T>: non-negative and symmetric.
 * The triangle inequality is not required.
 */

namespace core {

template <typename T>
using Similarity = std::function<float(const T&, const T&)>;

// Ordered groups of points; each group is one cluster.
template <typename T>
using Partition = std::vector<std::vector<T>>;

struct EuclideanPoint {
  float x{0.0f};
  float y{0.0f};
  double t{0.0};
  std::string key{""};

  EuclideanPoint() = default;
  EuclideanPoint(float x_, float y_, double t_ = 0.0, std::string key_ = "")
    : x(x_), y(y_), t(t_), key(std::move(key_)) {}

  const std::string& id() const { return key; }
  double timestamp() const { return t; }

  static EuclideanPoint centroid(const std::vector<EuclideanPoint>& points,
                                 const std::vector<double>& weights);
};

// Geolocated stream element (longitude/latitude in degrees).
struct GeoPoint {
  float longitude{0.0f};
  float latitude{0.0f};
  double t{0.0};
  std::string key{""};

  GeoPoint() = default;
  GeoPoint(float lon, float lat, double t_ = 0.0, std::string key_ = "")
    : longitude(lon), latitude(lat), t(t_), key(std::move(key_)) {}

  const std::string& id() const { return key; }
  double timestamp() const { return t; }

  static GeoPoint centroid(const std::vector<GeoPoint>& points,
                           const std::vector<double>& weights);
};

float euclidean_distance(const EuclideanPoint& a, const EuclideanPoint& b);

// Great-circle distance in kilometres.
float haversine_km(const GeoPoint& a, const GeoPoint& b);

} // namespace core
