#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <json/json.h>
#include "config/config.h"
#include "core/ingest_queue.h"
#include "core/maintenance_loop.h"
#include "core/micro_cluster.h"
#include "core/point.h"
#include "detect/dbscan.h"
#include "detect/shrinkage.h"

/**
 * Online density clustering of a point stream.
 *
 * Producers add() points into an ingestion queue. A single background
 * maintenance thread (start()) pulls them one at a time and merges each into
 * the micro-cluster set:
 *   1. pick the micro-cluster whose center is closest to the point
 *      (first one wins on ties),
 *   2. insert it there and keep it if the radius stays within max_radius,
 *   3. otherwise open a new singleton micro-cluster.
 * Dequeue and merge run inside one critical section on the set, so readers
 * (cluster(), microClusters()) only ever see completed merges.
 *
 * cluster() runs MicroClusterDBSCAN over the micro-cluster centers and returns
 * the member points of every macro-cluster. refine() splits one such group
 * further with ShrinkageRefiner.
 */

namespace core {

// Misuse of the engine lifecycle: start twice, start or add after teardown.
class EngineStateError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

struct MaintenanceStats {
  uint64_t merged{0};              // points merged into the set
  uint64_t absorbed{0};            // ... of which joined an existing micro-cluster
  uint64_t created{0};             // micro-clusters opened
  uint64_t pruned{0};              // micro-clusters dropped for decayed weight
  uint64_t removed{0};             // points evicted by identity
  uint64_t replaced{0};            // members re-placed after an eviction broke the radius bound
  uint64_t failed{0};              // merges aborted by a throwing similarity
  uint64_t contention_retries{0};  // maintenance steps skipped while a reader held the set
};

template <typename T>
class StreamClusterer {
public:
  explicit StreamClusterer(Similarity<T> similarity, const EngineConfig& config = EngineConfig{})
    : state_(std::make_shared<State>(std::move(similarity), config)),
      loop_(std::make_shared<MaintenanceLoop>(
          "StreamClusterer", std::chrono::microseconds(config.maintenance.idle_sleep_us))) {}

  ~StreamClusterer() {
    loop_->stop();
    state_->teardown();
  }

  StreamClusterer(const StreamClusterer&) = delete;
  StreamClusterer& operator=(const StreamClusterer&) = delete;

  void add(const T& point) {
    if (!state_->queue.enqueue(point))
      throw EngineStateError("StreamClusterer::add: engine was terminated");
  }

  void add(const std::vector<T>& points) {
    if (!state_->queue.enqueueAll(points))
      throw EngineStateError("StreamClusterer::add: engine was terminated");
  }

  template <typename InputIt>
  void add(InputIt first, InputIt last) {
    add(std::vector<T>(first, last));
  }

  // Evicts every member with this identity and drops micro-clusters left empty.
  // Timeless micro-clusters pushed past max_radius by the eviction are split up.
  size_t remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->removeLocked(id);
  }

  // Launches the maintenance thread. The returned handle terminates and joins
  // it; afterwards the queue is discarded and the engine accepts no more points.
  StopHandle start() {
    if (state_->terminated.load() || state_->queue.closed())
      throw EngineStateError("StreamClusterer::start: engine was torn down");
    if (loop_->started())
      throw EngineStateError("StreamClusterer::start: maintenance already started");

    auto st = state_;
    if (!loop_->start([st] { return st->step(); }))
      throw EngineStateError("StreamClusterer::start: maintenance already started");

    st->maintaining = true;
    std::cout << "[StreamClusterer] maintenance started (mode="
              << to_string(st->cfg.micro_cluster.mode)
              << ", max_radius=" << st->cfg.micro_cluster.max_radius << ")" << std::endl;

    return StopHandle(loop_, [st] {
      st->teardown();
      std::cout << "[StreamClusterer] maintenance terminated, queue discarded" << std::endl;
    });
  }

  // Merges everything queued so far on the calling thread.
  size_t drain() {
    std::lock_guard<std::mutex> lk(state_->mu);
    size_t n = 0;
    while (auto p = state_->queue.tryDequeue()) {
      state_->mergeLocked(*p);
      ++n;
    }
    return n;
  }

  // True once the queue is empty with no merge in flight.
  bool awaitIdle(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
      {
        std::lock_guard<std::mutex> lk(state_->mu);
        if (state_->queue.empty()) return true;
      }
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  // Current macro-cluster partition. Noise micro-clusters are left out; in
  // temporal mode outlier micro-clusters do not take part at all.
  Partition<T> cluster() const {
    double now = 0.0;
    std::vector<MicroCluster<T>> snapshot = state_->snapshot(now);

    const auto& mc_cfg = state_->cfg.micro_cluster;
    std::vector<size_t> units;
    std::vector<T> centers;
    std::vector<double> weights;
    for (size_t i = 0; i < snapshot.size(); ++i) {
      if (!snapshot[i].isPotentialCore(now, mc_cfg.weight_threshold)) continue;
      units.push_back(i);
      centers.push_back(snapshot[i].center(now));
      weights.push_back(snapshot[i].weight(now));
    }

    const auto& sim = *state_->similarity;
    MicroClusterDBSCAN dbscan(state_->cfg.dbscan.eps, state_->cfg.dbscan.minPts);
    const DbscanResult res = dbscan.run(weights, [&](size_t a, size_t b) {
      return sim(centers[a], centers[b]);
    });

    Partition<T> groups(static_cast<size_t>(res.cluster_count));
    for (size_t u = 0; u < units.size(); ++u) {
      const int label = res.labels[u];
      if (label < 0) continue;
      const auto& pts = snapshot[units[u]].points();
      groups[static_cast<size_t>(label)].insert(groups[static_cast<size_t>(label)].end(),
                                                pts.begin(), pts.end());
    }
    return groups;
  }

  std::vector<MicroCluster<T>> microClusters() const {
    double now = 0.0;
    return state_->snapshot(now);
  }

  // Splits points (typically one group of cluster()) into at most
  // min(sub_cluster_budget, points.size()) sub-groups.
  Partition<T> refine(const std::vector<T>& points, int sub_cluster_budget, int iteration_budget) const {
    ShrinkageConfig c = state_->cfg.shrinkage;
    c.max_subclusters = sub_cluster_budget;
    c.max_iterations = iteration_budget;
    ShrinkageRefiner<T> refiner(c, *state_->similarity);
    return refiner.cluster(points);
  }

  double currentTime() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->now;
  }

  MaintenanceStats stats() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    MaintenanceStats s = state_->stats;
    s.contention_retries = state_->contention.load();
    return s;
  }

  size_t pending() const { return state_->queue.size(); }
  bool maintaining() const { return state_->maintaining.load() && loop_->running(); }
  bool terminated() const { return state_->terminated.load(); }
  const EngineConfig& config() const { return state_->cfg; }

  Json::Value microClustersAsJson() const {
    double now = 0.0;
    const auto snapshot = state_->snapshot(now);
    const double threshold = state_->cfg.micro_cluster.weight_threshold;

    Json::Value arr(Json::arrayValue);
    for (size_t i = 0; i < snapshot.size(); ++i) {
      const auto& mc = snapshot[i];
      Json::Value m(Json::objectValue);
      m["index"] = static_cast<Json::UInt64>(i);
      m["kind"] = to_string(mc.kind());
      m["size"] = static_cast<Json::UInt64>(mc.size());
      m["weight"] = mc.weight(now);
      m["radius"] = mc.radius(now);
      m["potential_core"] = mc.isPotentialCore(now, threshold);
      Json::Value ids(Json::arrayValue);
      for (const auto& p : mc.points()) ids.append(p.id());
      m["members"] = ids;
      arr.append(m);
    }
    return arr;
  }

  Json::Value statsAsJson() const {
    const MaintenanceStats s = stats();
    Json::Value j(Json::objectValue);
    j["merged"] = static_cast<Json::UInt64>(s.merged);
    j["absorbed"] = static_cast<Json::UInt64>(s.absorbed);
    j["created"] = static_cast<Json::UInt64>(s.created);
    j["pruned"] = static_cast<Json::UInt64>(s.pruned);
    j["removed"] = static_cast<Json::UInt64>(s.removed);
    j["replaced"] = static_cast<Json::UInt64>(s.replaced);
    j["failed"] = static_cast<Json::UInt64>(s.failed);
    j["contention_retries"] = static_cast<Json::UInt64>(s.contention_retries);
    j["pending"] = static_cast<Json::UInt64>(pending());
    j["current_time"] = currentTime();
    j["maintaining"] = maintaining();
    return j;
  }

private:
  struct State {
    State(Similarity<T> sim, const EngineConfig& config)
      : cfg(config), similarity(std::make_shared<const Similarity<T>>(std::move(sim))) {}

    const EngineConfig cfg;
    const std::shared_ptr<const Similarity<T>> similarity;
    IngestQueue<T> queue;

    mutable std::mutex mu;                 // guards everything below
    std::vector<MicroCluster<T>> clusters;
    double now{0.0};
    bool has_time{false};
    int merges_since_prune{0};
    MaintenanceStats stats;

    std::atomic<bool> maintaining{false};
    std::atomic<bool> terminated{false};
    std::atomic<uint64_t> contention{0};

    // One maintenance iteration. Never dequeues unless it owns the set, so a
    // busy set costs a retry, not a point.
    bool step() {
      std::unique_lock<std::mutex> lk(mu, std::try_to_lock);
      if (!lk.owns_lock()) {
        contention.fetch_add(1);
        return false;
      }
      auto p = queue.tryDequeue();
      if (!p) return false;
      try {
        mergeLocked(*p);
      } catch (const std::exception& e) {
        ++stats.failed;
        std::cerr << "[StreamClusterer] merge of point id=" << p->id()
                  << " failed: " << e.what() << std::endl;
      }
      return true;
    }

    void mergeLocked(const T& p) {
      if (!has_time || p.timestamp() > now) {
        now = p.timestamp();
        has_time = true;
      }
      placeLocked(p);
      ++stats.merged;

      const auto& mc_cfg = cfg.micro_cluster;
      if (mc_cfg.mode == MicroClusterKind::Temporal && ++merges_since_prune >= mc_cfg.prune_interval) {
        merges_since_prune = 0;
        pruneLocked();
      }
    }

    // Nearest micro-cluster if the radius bound still holds, else a new singleton.
    // Distances are evaluated before anything is mutated.
    void placeLocked(const T& p) {
      const auto& mc_cfg = cfg.micro_cluster;
      const auto& sim = *similarity;

      if (!clusters.empty()) {
        size_t best = 0;
        float best_d = sim(clusters[0].center(now), p);
        for (size_t i = 1; i < clusters.size(); ++i) {
          const float d = sim(clusters[i].center(now), p);
          if (d < best_d) { best_d = d; best = i; }
        }

        auto& mc = clusters[best];
        mc.insert(p);
        float r = 0.0f;
        try {
          r = mc.radius(now);
        } catch (...) {
          mc.popLast();
          throw;
        }
        if (r <= mc_cfg.max_radius) {
          ++stats.absorbed;
          return;
        }
        mc.popLast();
      }

      openSingletonLocked(p);
    }

    void openSingletonLocked(const T& p) {
      const auto& mc_cfg = cfg.micro_cluster;
      clusters.emplace_back(mc_cfg.mode, similarity, mc_cfg.decay_lambda, std::vector<T>{p});
      ++stats.created;
    }

    void pruneLocked() {
      const double min_weight = cfg.micro_cluster.min_weight;
      const size_t before = clusters.size();
      clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                    [&](const MicroCluster<T>& mc) { return mc.weight(now) < min_weight; }),
                     clusters.end());
      stats.pruned += before - clusters.size();
    }

    size_t removeLocked(const std::string& id) {
      size_t n = 0;
      for (auto& mc : clusters) n += mc.remove(id);
      clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                    [](const MicroCluster<T>& mc) { return mc.empty(); }),
                     clusters.end());
      stats.removed += n;
      if (n > 0) rebalanceLocked();
      return n;
    }

    // An eviction moves the centroid away from the evicted point, so a timeless
    // micro-cluster can exceed max_radius afterwards. Such clusters are taken
    // out of the set and their members placed again one by one.
    void rebalanceLocked() {
      const float max_radius = cfg.micro_cluster.max_radius;
      std::vector<bool> over(clusters.size(), false);
      bool any = false;
      for (size_t i = 0; i < clusters.size(); ++i) {
        over[i] = clusters[i].kind() == MicroClusterKind::Timeless && clusters[i].radius(now) > max_radius;
        any = any || over[i];
      }
      if (!any) return;

      std::vector<MicroCluster<T>> kept;
      std::vector<T> displaced;
      for (size_t i = 0; i < clusters.size(); ++i) {
        if (over[i]) {
          const auto& pts = clusters[i].points();
          displaced.insert(displaced.end(), pts.begin(), pts.end());
        } else {
          kept.push_back(std::move(clusters[i]));
        }
      }
      clusters = std::move(kept);

      for (const auto& p : displaced) {
        try {
          placeLocked(p);
        } catch (const std::exception& e) {
          openSingletonLocked(p);
          std::cerr << "[StreamClusterer] re-placing point id=" << p.id()
                    << " failed, kept as singleton: " << e.what() << std::endl;
        }
        ++stats.replaced;
      }
    }

    std::vector<MicroCluster<T>> snapshot(double& t) const {
      std::lock_guard<std::mutex> lk(mu);
      t = now;
      return clusters;
    }

    void teardown() {
      terminated = true;
      maintaining = false;
      queue.close();
    }
  };

  std::shared_ptr<State> state_;
  std::shared_ptr<MaintenanceLoop> loop_;
};

} // namespace core
