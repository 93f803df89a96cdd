#include "pipeline_scheduler.hpp"

#include <stdexcept>

namespace airtime::pipeline {

void PipelineScheduler::Enqueue(const ChannelRunTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("pipeline scheduler is shut down");
    }
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ChannelRunTask> PipelineScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ChannelRunTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void PipelineScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace airtime::pipeline
