#include <gtest/gtest.h>
#include "core/point.h"
#include "detect/shrinkage.h"

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

using core::EuclideanPoint;

namespace {

// Two tight blobs, n_per_blob points each, around (0,0) and (100,100).
std::vector<EuclideanPoint> make_two_blobs(size_t n_per_blob) {
    std::vector<EuclideanPoint> pts;
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> jitter(-1.0f, 1.0f);
    for (size_t i = 0; i < n_per_blob; ++i)
        pts.emplace_back(jitter(rng), jitter(rng), 0.0, "a" + std::to_string(i));
    for (size_t i = 0; i < n_per_blob; ++i)
        pts.emplace_back(100.0f + jitter(rng), 100.0f + jitter(rng), 0.0, "b" + std::to_string(i));
    return pts;
}

std::multiset<std::string> ids_of(const core::Partition<EuclideanPoint>& groups) {
    std::multiset<std::string> ids;
    for (const auto& g : groups)
        for (const auto& p : g) ids.insert(p.id());
    return ids;
}

std::multiset<std::string> ids_of(const std::vector<EuclideanPoint>& pts) {
    std::multiset<std::string> ids;
    for (const auto& p : pts) ids.insert(p.id());
    return ids;
}

} // namespace

TEST(ShrinkageRefiner, EmptyInputGivesEmptyResult) {
    auto groups = refine<EuclideanPoint>({}, 5, 10, core::euclidean_distance);
    EXPECT_TRUE(groups.empty());
}

TEST(ShrinkageRefiner, NeverExceedsBudgetOrInputSize) {
    const auto pts = make_two_blobs(10);

    for (int budget : {1, 3, 7}) {
        auto groups = refine(pts, budget, 10, core::Similarity<EuclideanPoint>(core::euclidean_distance));
        EXPECT_LE(groups.size(), static_cast<size_t>(budget));
        EXPECT_EQ(ids_of(groups), ids_of(pts));
    }

    const std::vector<EuclideanPoint> few = {{0.0f, 0.0f, 0.0, "p"}, {50.0f, 0.0f, 0.0, "q"}};
    auto groups = refine(few, 100, 10, core::Similarity<EuclideanPoint>(core::euclidean_distance));
    EXPECT_LE(groups.size(), few.size());
    EXPECT_EQ(ids_of(groups), ids_of(few));
}

TEST(ShrinkageRefiner, SingleBudgetKeepsEverythingTogether) {
    const auto pts = make_two_blobs(5);
    auto groups = refine(pts, 1, 10, core::Similarity<EuclideanPoint>(core::euclidean_distance));
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), pts.size());
}

TEST(ShrinkageRefiner, SeparatesWellApartBlobs) {
    const auto pts = make_two_blobs(5);
    ShrinkageRefiner<EuclideanPoint> refiner(2, 20, core::euclidean_distance);
    auto groups = refiner.cluster(pts);

    ASSERT_EQ(groups.size(), 2u);
    for (const auto& g : groups) {
        ASSERT_EQ(g.size(), 5u);
        const char blob = g.front().id()[0];
        for (const auto& p : g) EXPECT_EQ(p.id()[0], blob);
    }
    EXPECT_TRUE(refiner.getLastStats().converged);
    EXPECT_EQ(refiner.getLastStats().input_points, pts.size());
    EXPECT_EQ(refiner.getLastStats().final_groups, 2u);
}

TEST(ShrinkageRefiner, UnderSupportedExemplarsShrinkAway) {
    const std::vector<EuclideanPoint> square = {
        {0.0f, 0.0f, 0.0, "a"}, {1.0f, 0.0f, 0.0, "b"},
        {0.0f, 1.0f, 0.0, "c"}, {1.0f, 1.0f, 0.0, "d"}};

    ShrinkageConfig cfg;
    cfg.max_subclusters = 4;
    cfg.max_iterations = 20;
    cfg.min_support = 2;
    ShrinkageRefiner<EuclideanPoint> refiner(cfg, core::euclidean_distance);
    auto groups = refiner.cluster(square);

    EXPECT_LE(groups.size(), 2u);
    for (const auto& g : groups) EXPECT_GE(g.size(), 2u);
    EXPECT_EQ(ids_of(groups), ids_of(square));
    EXPECT_GE(refiner.getLastStats().shrunk_exemplars, 2u);
}

TEST(ShrinkageRefiner, SameSeedSamePartition) {
    const auto pts = make_two_blobs(8);
    ShrinkageRefiner<EuclideanPoint> first(3, 10, core::euclidean_distance);
    ShrinkageRefiner<EuclideanPoint> second(3, 10, core::euclidean_distance);

    auto a = first.cluster(pts);
    auto b = second.cluster(pts);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) EXPECT_EQ(ids_of(a[i]), ids_of(b[i]));
}

TEST(ShrinkageRefiner, StatsDescribeTheLastRun) {
    ShrinkageRefiner<EuclideanPoint> refiner(2, 10, core::euclidean_distance);

    refiner.cluster(make_two_blobs(4));
    EXPECT_EQ(refiner.getLastStats().input_points, 8u);

    refiner.cluster({});
    EXPECT_EQ(refiner.getLastStats().input_points, 0u);
    EXPECT_EQ(refiner.getLastStats().final_groups, 0u);
    EXPECT_EQ(refiner.getLastStats().iterations, 0);
}
