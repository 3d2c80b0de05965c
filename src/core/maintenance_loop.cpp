#include "maintenance_loop.h"
#include <exception>
#include <iostream>
#include <utility>

namespace core {

MaintenanceLoop::MaintenanceLoop(std::string name, std::chrono::microseconds idle_sleep)
  : name_(std::move(name)), idle_sleep_(idle_sleep) {
}

MaintenanceLoop::~MaintenanceLoop() {
  stop();
}

bool MaintenanceLoop::start(Step step) {
  if (started_.exchange(true)) {
    std::cerr << "[MaintenanceLoop] " << name_ << " already started.\n";
    return false;
  }
  running_ = true;
  th_ = std::thread([this, step = std::move(step)] { run(step); });
  std::cout << "[MaintenanceLoop] " << name_ << " started" << std::endl;
  return true;
}

void MaintenanceLoop::stop() {
  stop_requested_ = true;
  std::lock_guard<std::mutex> lk(join_mu_);
  if (th_.joinable()) {
    th_.join();
    std::cout << "[MaintenanceLoop] " << name_ << " stopped" << std::endl;
  }
}

void MaintenanceLoop::run(Step step) {
  while (!stop_requested_.load()) {
    bool worked = false;
    try {
      worked = step();
    } catch (const std::exception& e) {
      // keep the loop alive; the offending step is not retried
      std::cerr << "[MaintenanceLoop] " << name_ << " step failed: " << e.what() << std::endl;
    }
    if (!worked) std::this_thread::sleep_for(idle_sleep_);
  }
  running_ = false;
}

StopHandle::StopHandle(std::shared_ptr<MaintenanceLoop> loop, std::function<void()> on_stopped)
  : loop_(std::move(loop)), on_stopped_(std::move(on_stopped)) {
}

StopHandle::~StopHandle() {
  stop();
}

StopHandle::StopHandle(StopHandle&& other) noexcept
  : loop_(std::move(other.loop_)), on_stopped_(std::move(other.on_stopped_)) {
  other.loop_.reset();
  other.on_stopped_ = nullptr;
}

StopHandle& StopHandle::operator=(StopHandle&& other) noexcept {
  if (this != &other) {
    stop();
    loop_ = std::move(other.loop_);
    on_stopped_ = std::move(other.on_stopped_);
    other.loop_.reset();
    other.on_stopped_ = nullptr;
  }
  return *this;
}

void StopHandle::stop() {
  if (!loop_) return;
  loop_->stop();
  loop_.reset();
  if (on_stopped_) {
    auto hook = std::move(on_stopped_);
    on_stopped_ = nullptr;
    hook();
  }
}

} // namespace core
