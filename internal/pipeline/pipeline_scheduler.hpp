#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "pipeline_task.hpp"

namespace airtime::pipeline {

/*
  Thread-safe blocking queue for pipeline workers.

  After Shutdown() the remaining tasks are still handed out; Dequeue()
  returns nullopt once the queue is drained.
*/
class PipelineScheduler {
 public:
  void Enqueue(const ChannelRunTask& task);

  // blocking wait
  std::optional<ChannelRunTask> Dequeue();

  void Shutdown();

 private:
  std::mutex                 mutex_;
  std::condition_variable    cv_;
  std::queue<ChannelRunTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace airtime::pipeline
