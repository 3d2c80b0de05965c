#include <gtest/gtest.h>
#include "core/point.h"

#include <vector>

using namespace core;

TEST(EuclideanPoint, DistanceIsEuclidean) {
    EuclideanPoint a(0.0f, 0.0f);
    EuclideanPoint b(3.0f, 4.0f);
    EXPECT_FLOAT_EQ(euclidean_distance(a, b), 5.0f);
    EXPECT_FLOAT_EQ(euclidean_distance(b, a), 5.0f);
    EXPECT_FLOAT_EQ(euclidean_distance(a, a), 0.0f);
}

TEST(EuclideanPoint, CentroidIsWeightedMean) {
    std::vector<EuclideanPoint> pts = {{0.0f, 0.0f, 1.0, "a"}, {4.0f, 0.0f, 3.0, "b"}};

    auto even = EuclideanPoint::centroid(pts, {1.0, 1.0});
    EXPECT_FLOAT_EQ(even.x, 2.0f);
    EXPECT_FLOAT_EQ(even.y, 0.0f);
    EXPECT_DOUBLE_EQ(even.timestamp(), 3.0);

    auto skewed = EuclideanPoint::centroid(pts, {3.0, 1.0});
    EXPECT_FLOAT_EQ(skewed.x, 1.0f);
}

TEST(EuclideanPoint, CentroidOfFullyDecayedSetFallsBackToMean) {
    std::vector<EuclideanPoint> pts = {{0.0f, 2.0f}, {2.0f, 4.0f}};
    auto c = EuclideanPoint::centroid(pts, {0.0, 0.0});
    EXPECT_FLOAT_EQ(c.x, 1.0f);
    EXPECT_FLOAT_EQ(c.y, 3.0f);
}

TEST(GeoPoint, HaversineOneDegreeOfLatitude) {
    GeoPoint a(0.0f, 0.0f);
    GeoPoint b(0.0f, 1.0f);
    EXPECT_NEAR(haversine_km(a, b), 111.19f, 0.05f);
    EXPECT_NEAR(haversine_km(b, a), haversine_km(a, b), 1e-4f);
    EXPECT_FLOAT_EQ(haversine_km(a, a), 0.0f);
}

TEST(GeoPoint, CentroidAveragesCoordinates) {
    std::vector<GeoPoint> pts = {{10.0f, 50.0f, 0.0, "x"}, {12.0f, 52.0f, 5.0, "y"}};
    auto c = GeoPoint::centroid(pts, {1.0, 1.0});
    EXPECT_FLOAT_EQ(c.longitude, 11.0f);
    EXPECT_FLOAT_EQ(c.latitude, 51.0f);
    EXPECT_DOUBLE_EQ(c.timestamp(), 5.0);
}
