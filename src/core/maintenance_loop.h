#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace core {

// Background worker that repeatedly runs one step until asked to stop.
//
// A step returns true when it did work; otherwise the loop sleeps for the idle
// period before polling again. The stop flag is only read between steps, so a
// step that started always runs to completion.
class MaintenanceLoop {
public:
  using Step = std::function<bool()>;

  explicit MaintenanceLoop(std::string name,
                           std::chrono::microseconds idle_sleep = std::chrono::microseconds(500));
  ~MaintenanceLoop();

  MaintenanceLoop(const MaintenanceLoop&) = delete;
  MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;

  // Returns false if the loop already ran (a loop is started at most once).
  bool start(Step step);

  // Signals termination and joins. Safe to call repeatedly and from any
  // thread other than the worker itself.
  void stop();

  bool running() const { return running_.load(); }
  bool started() const { return started_.load(); }

private:
  void run(Step step);

  std::string name_;
  std::chrono::microseconds idle_sleep_;
  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex join_mu_;
  std::thread th_;
};

// Single owner of a running maintenance loop.
//
// Invoking the handle (or stop()) terminates the loop and blocks until the
// worker thread has exited, then runs the on-stopped hook once. Destroying a
// handle that was not stopped yet stops it as well.
class StopHandle {
public:
  StopHandle() = default;
  StopHandle(std::shared_ptr<MaintenanceLoop> loop, std::function<void()> on_stopped);
  ~StopHandle();

  StopHandle(StopHandle&& other) noexcept;
  StopHandle& operator=(StopHandle&& other) noexcept;
  StopHandle(const StopHandle&) = delete;
  StopHandle& operator=(const StopHandle&) = delete;

  void stop();
  void operator()() { stop(); }

  bool active() const { return loop_ != nullptr; }

private:
  std::shared_ptr<MaintenanceLoop> loop_;
  std::function<void()> on_stopped_;
};

} // namespace core
