#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sharedidx {

/**
 * @brief Runs submitted tasks one at a time in submission order.
 *
 * In Background mode a single worker thread drains a FIFO queue. In
 * SameThread mode execute() runs the task inline on the caller's thread,
 * which keeps unit tests deterministic.
 *
 * Tasks are expected to report their own failures. An exception escaping a
 * task is logged and the worker continues with the next task.
 */
class SequentialExecutor {
public:
  enum class Mode { Background, SameThread };

  explicit SequentialExecutor(std::string name, Mode mode = Mode::Background);
  ~SequentialExecutor();

  SequentialExecutor(const SequentialExecutor &) = delete;
  SequentialExecutor &operator=(const SequentialExecutor &) = delete;

  /// @throws std::logic_error after stop().
  void execute(std::function<void()> task);

  /** Run every queued task, then join the worker. Idempotent. */
  void stop();

  Mode mode() const { return mode_; }
  bool isWorkerThread() const;

private:
  void threadFunc();
  void runTask(const std::function<void()> &task);

  std::string name_;
  Mode mode_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  std::thread worker_;
};

} // namespace sharedidx
