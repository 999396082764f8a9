#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>
#include <vector>

namespace lanlight {

/**
 * Host-owned, single-threaded event loop the engine schedules its work on.
 *
 * Implementations must run every task, timer and read handler on the one
 * thread that drives the loop, never inline from the call that queued it.
 */
class EventLoop {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;

  virtual ~EventLoop() = default;

  /// Current time on the loop's clock.
  virtual std::chrono::steady_clock::time_point Now() const = 0;
  /// Queue a task to run on a later loop iteration.
  virtual void Post(Task task) = 0;
  /// Run `task` once after `delay`. Returns an id usable with CancelTimer().
  virtual TimerId CallLater(std::chrono::milliseconds delay, Task task) = 0;
  /// Cancel a pending timer. Unknown or fired ids are ignored.
  virtual void CancelTimer(TimerId id) = 0;
  /// Invoke `handler` whenever `fd` is readable. Replaces a previous handler.
  virtual bool WatchReadable(int fd, Task handler) = 0;
  /// Stop watching `fd`.
  virtual void Unwatch(int fd) = 0;
};

/**
 * Reference EventLoop built on select(), for hosts without a loop of their own.
 */
class SelectLoop : public EventLoop {
 public:
  SelectLoop();
  ~SelectLoop() override;

  SelectLoop(const SelectLoop&) = delete;
  SelectLoop& operator=(const SelectLoop&) = delete;

  std::chrono::steady_clock::time_point Now() const override;
  void Post(Task task) override;
  TimerId CallLater(std::chrono::milliseconds delay, Task task) override;
  void CancelTimer(TimerId id) override;
  bool WatchReadable(int fd, Task handler) override;
  void Unwatch(int fd) override;

  /**
   * Run posted tasks, due timers and ready read handlers once.
   *
   * @param max_wait Upper bound on the time spent waiting for readiness.
   */
  void RunOnce(std::chrono::milliseconds max_wait);
  /// Loop until Stop() is called.
  void Run();
  /// Make Run() return after the current iteration.
  void Stop();

 private:
  struct Timer {
    TimerId id = 0;
    Task task;
  };

  void RunPosted();
  void RunDueTimers();

  std::vector<Task> posted_;
  std::multimap<std::chrono::steady_clock::time_point, Timer> timers_;
  std::unordered_map<TimerId, std::chrono::steady_clock::time_point> timer_index_;
  std::unordered_map<int, std::shared_ptr<Task>> watchers_;
  TimerId next_timer_id_ = 1;
  bool stopping_ = false;
};

}  // namespace lanlight
