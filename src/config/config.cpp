#include "config.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

const char* to_string(core::MicroClusterKind kind) {
  return kind == core::MicroClusterKind::Temporal ? "temporal" : "timeless";
}

core::MicroClusterKind parse_micro_cluster_kind(const std::string& s) {
  if (s == "timeless") return core::MicroClusterKind::Timeless;
  if (s == "temporal") return core::MicroClusterKind::Temporal;
  throw std::runtime_error("unknown micro_cluster mode: " + s);
}

static EngineConfig parseNode(const YAML::Node& y) {
  EngineConfig cfg;

  if (auto m = y["micro_cluster"]) {
    auto& mc = cfg.micro_cluster;
    if (m["mode"])             mc.mode             = parse_micro_cluster_kind(m["mode"].as<std::string>());
    if (m["max_radius"])       mc.max_radius       = std::max(0.0f, m["max_radius"].as<float>(mc.max_radius));
    if (m["decay_lambda"])     mc.decay_lambda     = std::max(0.0, m["decay_lambda"].as<double>(mc.decay_lambda));
    if (m["weight_threshold"]) mc.weight_threshold = std::max(0.0, m["weight_threshold"].as<double>(mc.weight_threshold));
    if (m["min_weight"])       mc.min_weight       = std::max(0.0, m["min_weight"].as<double>(mc.min_weight));
    if (m["prune_interval"])   mc.prune_interval   = std::max(1, m["prune_interval"].as<int>(mc.prune_interval));
  }

  if (auto d = y["dbscan"]) {
    if (d["eps"])    cfg.dbscan.eps    = std::max(0.0f, d["eps"].as<float>(cfg.dbscan.eps));
    if (d["minPts"]) cfg.dbscan.minPts = std::max(1, d["minPts"].as<int>(cfg.dbscan.minPts));
  }

  if (auto s = y["shrinkage"]) {
    auto& sc = cfg.shrinkage;
    if (s["max_subclusters"]) sc.max_subclusters = std::max(1, s["max_subclusters"].as<int>(sc.max_subclusters));
    if (s["max_iterations"])  sc.max_iterations  = std::max(1, s["max_iterations"].as<int>(sc.max_iterations));
    if (s["min_support"])     sc.min_support     = std::max(1, s["min_support"].as<int>(sc.min_support));
    if (s["seed"])            sc.seed            = s["seed"].as<uint32_t>(sc.seed);
  }

  if (auto mt = y["maintenance"]) {
    if (mt["idle_sleep_us"]) cfg.maintenance.idle_sleep_us = std::max(0, mt["idle_sleep_us"].as<int>(cfg.maintenance.idle_sleep_us));
  }

  return cfg;
}

EngineConfig load_engine_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  EngineConfig cfg = parseNode(y);
  std::cout << "[Config] loaded " << path
            << " (mode=" << to_string(cfg.micro_cluster.mode)
            << ", max_radius=" << cfg.micro_cluster.max_radius
            << ", eps=" << cfg.dbscan.eps
            << ", minPts=" << cfg.dbscan.minPts << ")" << std::endl;
  return cfg;
}

EngineConfig parse_engine_config(const std::string& yaml_text) {
  return parseNode(YAML::Load(yaml_text));
}

std::string dump_engine_config(const EngineConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  // Micro-clusters
  out << YAML::Key << "micro_cluster" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "mode" << YAML::Value << to_string(cfg.micro_cluster.mode);
  out << YAML::Key << "max_radius" << YAML::Value << cfg.micro_cluster.max_radius;
  out << YAML::Key << "decay_lambda" << YAML::Value << cfg.micro_cluster.decay_lambda;
  out << YAML::Key << "weight_threshold" << YAML::Value << cfg.micro_cluster.weight_threshold;
  out << YAML::Key << "min_weight" << YAML::Value << cfg.micro_cluster.min_weight;
  out << YAML::Key << "prune_interval" << YAML::Value << cfg.micro_cluster.prune_interval;
  out << YAML::EndMap;

  // DBSCAN
  out << YAML::Key << "dbscan" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "eps" << YAML::Value << cfg.dbscan.eps;
  out << YAML::Key << "minPts" << YAML::Value << cfg.dbscan.minPts;
  out << YAML::EndMap;

  // Shrinkage
  out << YAML::Key << "shrinkage" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "max_subclusters" << YAML::Value << cfg.shrinkage.max_subclusters;
  out << YAML::Key << "max_iterations" << YAML::Value << cfg.shrinkage.max_iterations;
  out << YAML::Key << "min_support" << YAML::Value << cfg.shrinkage.min_support;
  out << YAML::Key << "seed" << YAML::Value << cfg.shrinkage.seed;
  out << YAML::EndMap;

  // Maintenance
  out << YAML::Key << "maintenance" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "idle_sleep_us" << YAML::Value << cfg.maintenance.idle_sleep_us;
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str());
}
