#include "lanlight/event_loop.h"

#include <algorithm>

#include <sys/select.h>

namespace lanlight {

SelectLoop::SelectLoop() = default;

SelectLoop::~SelectLoop() = default;

std::chrono::steady_clock::time_point SelectLoop::Now() const {
  return std::chrono::steady_clock::now();
}

void SelectLoop::Post(Task task) {
  if (task) {
    posted_.push_back(std::move(task));
  }
}

EventLoop::TimerId SelectLoop::CallLater(std::chrono::milliseconds delay,
                                         Task task) {
  const TimerId id = next_timer_id_++;
  const auto when = Now() + std::max(delay, std::chrono::milliseconds(0));
  timers_.emplace(when, Timer{id, std::move(task)});
  timer_index_[id] = when;
  return id;
}

void SelectLoop::CancelTimer(TimerId id) {
  auto index = timer_index_.find(id);
  if (index == timer_index_.end()) {
    return;
  }
  auto range = timers_.equal_range(index->second);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second.id == id) {
      timers_.erase(it);
      break;
    }
  }
  timer_index_.erase(index);
}

bool SelectLoop::WatchReadable(int fd, Task handler) {
  if (fd < 0 || fd >= FD_SETSIZE || !handler) {
    return false;
  }
  watchers_[fd] = std::make_shared<Task>(std::move(handler));
  return true;
}

void SelectLoop::Unwatch(int fd) { watchers_.erase(fd); }

void SelectLoop::RunPosted() {
  // Tasks posted while running wait for the next iteration.
  std::vector<Task> tasks;
  tasks.swap(posted_);
  for (auto& task : tasks) {
    task();
  }
}

void SelectLoop::RunDueTimers() {
  const auto now = Now();
  while (!timers_.empty() && timers_.begin()->first <= now) {
    auto it = timers_.begin();
    Task task = std::move(it->second.task);
    timer_index_.erase(it->second.id);
    timers_.erase(it);
    task();
  }
}

void SelectLoop::RunOnce(std::chrono::milliseconds max_wait) {
  RunPosted();
  RunDueTimers();

  auto wait = max_wait;
  if (!posted_.empty()) {
    wait = std::chrono::milliseconds(0);
  } else if (!timers_.empty()) {
    const auto until_timer = std::chrono::duration_cast<std::chrono::milliseconds>(
        timers_.begin()->first - Now());
    wait = std::max(std::chrono::milliseconds(0), std::min(wait, until_timer));
  }

  fd_set readfds;
  FD_ZERO(&readfds);
  int max_fd = -1;
  for (const auto& entry : watchers_) {
    FD_SET(entry.first, &readfds);
    max_fd = std::max(max_fd, entry.first);
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(wait.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((wait.count() % 1000) * 1000);
  const int ready = ::select(max_fd + 1, &readfds, nullptr, nullptr, &tv);
  if (ready > 0) {
    // Handlers may unwatch other descriptors; skip any that are gone.
    std::vector<std::pair<int, std::shared_ptr<Task>>> ready_handlers;
    for (const auto& entry : watchers_) {
      if (FD_ISSET(entry.first, &readfds)) {
        ready_handlers.emplace_back(entry.first, entry.second);
      }
    }
    for (const auto& ready_handler : ready_handlers) {
      auto it = watchers_.find(ready_handler.first);
      if (it == watchers_.end() || it->second != ready_handler.second) {
        continue;
      }
      (*ready_handler.second)();
    }
  }

  RunDueTimers();
}

void SelectLoop::Run() {
  stopping_ = false;
  while (!stopping_) {
    RunOnce(std::chrono::milliseconds(200));
  }
}

void SelectLoop::Stop() { stopping_ = true; }

}  // namespace lanlight
