#include "utilities/sequential_executor.hpp"
#include "utilities/logger.h"

#include <stdexcept>

namespace sharedidx {

SequentialExecutor::SequentialExecutor(std::string name, Mode mode)
    : name_(std::move(name)), mode_(mode) {
  running_ = true;
  if (mode_ == Mode::Background) {
    worker_ = std::thread(&SequentialExecutor::threadFunc, this);
  }
}

SequentialExecutor::~SequentialExecutor() { stop(); }

void SequentialExecutor::execute(std::function<void()> task) {
  if (!running_) {
    throw std::logic_error("Executor " + name_ + " is stopped");
  }
  if (mode_ == Mode::SameThread) {
    runTask(task);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      throw std::logic_error("Executor " + name_ + " is stopped");
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void SequentialExecutor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      worker_.join();
    }
  }
}

bool SequentialExecutor::isWorkerThread() const {
  return mode_ == Mode::Background &&
         worker_.get_id() == std::this_thread::get_id();
}

void SequentialExecutor::threadFunc() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (queue_.empty()) {
        return; // stopped and drained
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    runTask(task);
  }
}

void SequentialExecutor::runTask(const std::function<void()> &task) {
  try {
    task();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, name_,
                              std::string("Task failed: ") + e.what());
  }
}

} // namespace sharedidx
