#include "point.h"
#include <algorithm>
#include <cmath>

namespace core {

namespace {

constexpr double kEarthRadiusKm = 6371.0;

inline double deg2rad(double deg) {
  return deg * (M_PI / 180.0);
}

} // namespace

EuclideanPoint EuclideanPoint::centroid(const std::vector<EuclideanPoint>& points,
                                        const std::vector<double>& weights) {
  EuclideanPoint c;
  if (points.empty()) return c;
  c.t = points.front().t;

  double sx = 0.0, sy = 0.0, sw = 0.0;
  for (size_t i = 0; i < points.size(); ++i) {
    const double w = (i < weights.size()) ? weights[i] : 1.0;
    sx += w * points[i].x;
    sy += w * points[i].y;
    sw += w;
    c.t = std::max(c.t, points[i].t);
  }
  // fully decayed members: fall back to the plain mean
  if (sw <= 0.0) {
    sx = sy = 0.0;
    for (const auto& p : points) { sx += p.x; sy += p.y; }
    sw = static_cast<double>(points.size());
  }
  c.x = static_cast<float>(sx / sw);
  c.y = static_cast<float>(sy / sw);
  return c;
}

GeoPoint GeoPoint::centroid(const std::vector<GeoPoint>& points,
                            const std::vector<double>& weights) {
  GeoPoint c;
  if (points.empty()) return c;
  c.t = points.front().t;

  double slon = 0.0, slat = 0.0, sw = 0.0;
  for (size_t i = 0; i < points.size(); ++i) {
    const double w = (i < weights.size()) ? weights[i] : 1.0;
    slon += w * points[i].longitude;
    slat += w * points[i].latitude;
    sw += w;
    c.t = std::max(c.t, points[i].t);
  }
  if (sw <= 0.0) {
    slon = slat = 0.0;
    for (const auto& p : points) { slon += p.longitude; slat += p.latitude; }
    sw = static_cast<double>(points.size());
  }
  c.longitude = static_cast<float>(slon / sw);
  c.latitude  = static_cast<float>(slat / sw);
  return c;
}

float euclidean_distance(const EuclideanPoint& a, const EuclideanPoint& b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

float haversine_km(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = deg2rad(a.latitude);
  const double lat2 = deg2rad(b.latitude);
  const double dlat = lat2 - lat1;
  const double dlon = deg2rad(b.longitude - a.longitude);

  const double s = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1) * std::cos(lat2) *
                   std::sin(dlon / 2) * std::sin(dlon / 2);
  const double c = 2.0 * std::atan2(std::sqrt(s), std::sqrt(std::max(0.0, 1.0 - s)));
  return static_cast<float>(kEarthRadiusKm * c);
}

} // namespace core
