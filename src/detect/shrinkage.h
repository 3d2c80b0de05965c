#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <utility>
#include <vector>
#include "config/config.h"
#include "core/point.h"

struct ShrinkageStats {
    size_t input_points{0};
    size_t initial_exemplars{0};
    size_t final_groups{0};
    size_t shrunk_exemplars{0};
    int iterations{0};
    bool converged{false};

    void reset() {
        input_points = initial_exemplars = final_groups = shrunk_exemplars = 0;
        iterations = 0;
        converged = false;
    }
};

// Splits one macro-cluster into finer sub-groups.
//
// Exemplars are seeded by k-means++ sampling, then each iteration
//   (a) assigns every point to its nearest active exemplar,
//   (b) moves each exemplar to the centroid of its points,
//   (c) shrinks exemplars holding fewer than min_support points into their
//       nearest survivor, smallest first, always keeping at least one.
// Stops when an iteration moves no point or the iteration budget runs out.
template <typename T>
class ShrinkageRefiner {
private:
    ShrinkageConfig config_;
    core::Similarity<T> similarity_;
    ShrinkageStats stats_;

    size_t nearest(const T& p, const std::vector<T>& exemplars,
                   const std::vector<bool>& active) const {
        size_t best = exemplars.size();
        float best_d = std::numeric_limits<float>::max();
        for (size_t e = 0; e < exemplars.size(); ++e) {
            if (!active[e]) continue;
            const float d = similarity_(exemplars[e], p);
            if (best == exemplars.size() || d < best_d) { best_d = d; best = e; }
        }
        return best;
    }

    std::vector<T> seedExemplars(const std::vector<T>& points, size_t k) const {
        const size_t n = points.size();
        std::vector<T> exemplars;
        exemplars.reserve(k);

        std::mt19937 rng(config_.seed);
        std::uniform_int_distribution<size_t> uidx(0, n - 1);
        exemplars.push_back(points[uidx(rng)]);

        std::vector<float> min_dist(n);
        for (size_t i = 0; i < n; ++i) {
            const float d = similarity_(exemplars.front(), points[i]);
            min_dist[i] = d * d;
        }

        while (exemplars.size() < k) {
            float total = 0.0f;
            for (size_t i = 0; i < n; ++i) total += min_dist[i];
            if (total <= 0.0f) total = 1.0f;

            std::uniform_real_distribution<float> u(0.0f, total);
            float r = u(rng);
            size_t chosen = 0;
            for (; chosen < n && r >= 0.0f; ++chosen) r -= min_dist[chosen];
            if (chosen > 0) chosen--;
            chosen = std::min(chosen, n - 1);

            exemplars.push_back(points[chosen]);
            for (size_t i = 0; i < n; ++i) {
                const float d = similarity_(exemplars.back(), points[i]);
                min_dist[i] = std::min(min_dist[i], d * d);
            }
        }
        return exemplars;
    }

public:
    ShrinkageRefiner(const ShrinkageConfig& config, core::Similarity<T> similarity)
        : config_(config), similarity_(std::move(similarity)) {}

    ShrinkageRefiner(int max_subclusters, int max_iterations, core::Similarity<T> similarity)
        : similarity_(std::move(similarity)) {
        config_.max_subclusters = max_subclusters;
        config_.max_iterations = max_iterations;
    }

    const ShrinkageStats& getLastStats() const { return stats_; }

    core::Partition<T> cluster(const std::vector<T>& points) {
        stats_.reset();
        stats_.input_points = points.size();

        const size_t n = points.size();
        if (n == 0) return {};

        const size_t k = std::min(static_cast<size_t>(std::max(1, config_.max_subclusters)), n);
        const int max_iter = std::max(1, config_.max_iterations);
        const size_t min_support = static_cast<size_t>(std::max(1, config_.min_support));

        std::vector<T> exemplars = seedExemplars(points, k);
        std::vector<bool> active(k, true);
        size_t active_count = k;
        std::vector<size_t> assignment(n, k); // k = unassigned
        stats_.initial_exemplars = k;

        for (int iter = 0; iter < max_iter; ++iter) {
            size_t moved = 0;

            // (a) nearest exemplar
            for (size_t i = 0; i < n; ++i) {
                const size_t best = nearest(points[i], exemplars, active);
                if (assignment[i] != best) { assignment[i] = best; ++moved; }
            }

            // (b) exemplar = centroid of its points
            std::vector<std::vector<T>> members(k);
            for (size_t i = 0; i < n; ++i) members[assignment[i]].push_back(points[i]);
            for (size_t e = 0; e < k; ++e) {
                if (!active[e] || members[e].empty()) continue;
                exemplars[e] = T::centroid(members[e], std::vector<double>(members[e].size(), 1.0));
            }

            // (c) shrink under-supported exemplars, smallest first
            std::vector<size_t> order;
            for (size_t e = 0; e < k; ++e) if (active[e]) order.push_back(e);
            std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return members[a].size() < members[b].size();
            });

            for (size_t e : order) {
                if (active_count <= 1) break;
                if (members[e].size() >= min_support) continue;

                active[e] = false;
                --active_count;
                ++stats_.shrunk_exemplars;
                for (size_t i = 0; i < n; ++i) {
                    if (assignment[i] != e) continue;
                    const size_t to = nearest(points[i], exemplars, active);
                    assignment[i] = to;
                    members[to].push_back(points[i]);
                    ++moved;
                }
                members[e].clear();
            }

            stats_.iterations = iter + 1;
            if (moved == 0) {
                stats_.converged = true;
                break;
            }
        }

        core::Partition<T> groups(k);
        for (size_t i = 0; i < n; ++i) groups[assignment[i]].push_back(points[i]);
        groups.erase(std::remove_if(groups.begin(), groups.end(),
                                    [](const std::vector<T>& g) { return g.empty(); }),
                     groups.end());

        stats_.final_groups = groups.size();
        return groups;
    }
};

// One-shot refinement with the default shrink constants.
template <typename T>
core::Partition<T> refine(const std::vector<T>& points, int sub_cluster_budget,
                          int iteration_budget, core::Similarity<T> similarity) {
    ShrinkageRefiner<T> refiner(sub_cluster_budget, iteration_budget, std::move(similarity));
    return refiner.cluster(points);
}
