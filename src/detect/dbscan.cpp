#include "dbscan.h"
#include <algorithm>
#include <queue>
#include <utility>
#include <iostream>
#ifdef CLUSTERHUB_PROFILE
#include <chrono>
#endif

DbscanResult MicroClusterDBSCAN::run(const std::vector<double>& weights, const Distance& dist) const {
#ifdef CLUSTERHUB_PROFILE
    auto start_time = std::chrono::high_resolution_clock::now();
#endif

    DbscanResult result;
    const size_t N = weights.size();
    if (N == 0) return result;

    // Step 1: eps-neighbourhoods (micro-cluster sets are small, pairwise is fine)
    std::vector<std::vector<size_t>> neighbors(N);
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            if (dist(i, j) <= eps_) {
                neighbors[i].push_back(j);
                neighbors[j].push_back(i);
            }
        }
    }

    // Step 2: core units
    std::vector<bool> is_core(N, false);
    for (size_t i = 0; i < N; ++i) {
        double mass = weights[i];
        for (size_t j : neighbors[i]) mass += weights[j];

        const bool enough_units = static_cast<int>(neighbors[i].size()) >= minPts_;
        const bool enough_mass = mass >= static_cast<double>(minPts_);
        is_core[i] = enough_units || enough_mass;
        if (is_core[i]) result.core_count++;
    }

    // Step 3: expand clusters from core units
    std::vector<int> cluster_id(N, -1); // -1 = unvisited, -2 = noise, >=0 = cluster
    std::vector<bool> visited(N, false);
    int current_cluster = 0;

    for (size_t i = 0; i < N; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        if (!is_core[i]) {
            cluster_id[i] = DbscanResult::kNoise; // may still be claimed as border
            continue;
        }

        cluster_id[i] = current_cluster;

        std::queue<size_t> seed_set;
        for (size_t n : neighbors[i]) seed_set.push(n);

        while (!seed_set.empty()) {
            size_t q = seed_set.front();
            seed_set.pop();

            if (cluster_id[q] < 0) { // noise or unassigned: border or core joins
                cluster_id[q] = current_cluster;
            }

            if (visited[q]) continue;
            visited[q] = true;

            if (is_core[q]) {
                for (size_t qn : neighbors[q]) {
                    if (!visited[qn] || cluster_id[qn] < 0) seed_set.push(qn);
                }
            }
        }

        current_cluster++;
    }

    result.labels = std::move(cluster_id);
    result.cluster_count = current_cluster;
    result.noise_count = static_cast<size_t>(
        std::count(result.labels.begin(), result.labels.end(), DbscanResult::kNoise));

#ifdef CLUSTERHUB_PROFILE
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    std::cout << "[MicroClusterDBSCAN] N=" << N << " clusters=" << current_cluster
              << " time=" << duration.count() << "us" << std::endl;
#endif

    return result;
}
