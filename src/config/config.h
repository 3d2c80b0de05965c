#pragma once
#include <cstdint>
#include <string>
#include "core/decay.h"

struct MicroClusterConfig {
  core::MicroClusterKind mode{core::MicroClusterKind::Timeless}; // "timeless" | "temporal"
  float max_radius{15.0f};        // insertion bound on the micro-cluster radius
  double decay_lambda{0.01};      // weight = 2^(-lambda * age)
  double weight_threshold{2.0};   // potential-core vs outlier (temporal)
  double min_weight{0.5};         // pruned below this decayed weight (temporal)
  int prune_interval{100};        // merges between two pruning sweeps
};

struct DbscanConfig {
  float eps{250.0f};              // center-to-center similarity threshold
  int minPts{2};                  // core rule, see MicroClusterDBSCAN
};

struct ShrinkageConfig {
  int max_subclusters{8};         // exemplar budget (capped to the input size)
  int max_iterations{20};         // refinement iteration budget
  int min_support{2};             // exemplars below this many points are shrunk away
  uint32_t seed{42};              // exemplar seeding
};

struct MaintenanceConfig {
  int idle_sleep_us{500};         // back-off when the queue is empty or the set is busy
};

struct EngineConfig {
  MicroClusterConfig micro_cluster{};
  DbscanConfig dbscan{};
  ShrinkageConfig shrinkage{};
  MaintenanceConfig maintenance{};
};

EngineConfig load_engine_config(const std::string& path);
EngineConfig parse_engine_config(const std::string& yaml_text);
std::string dump_engine_config(const EngineConfig& cfg);

const char* to_string(core::MicroClusterKind kind);
core::MicroClusterKind parse_micro_cluster_kind(const std::string& s);
