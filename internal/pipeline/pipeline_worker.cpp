#include "pipeline_worker.hpp"

#include "internal/observability/logging.hpp"

namespace airtime::pipeline {

PipelineWorker::PipelineWorker(std::shared_ptr<PipelineScheduler> scheduler, std::shared_ptr<ChannelPipeline> pipeline,
                               std::shared_ptr<ingest::RecognitionSource> source, ReportSink sink)
    : scheduler_(std::move(scheduler)), pipeline_(std::move(pipeline)), source_(std::move(source)), sink_(std::move(sink)) {
}

PipelineWorker::~PipelineWorker() {
  Stop();
}

void PipelineWorker::Start() {
  thread_ = std::thread(&PipelineWorker::Run, this);
}

void PipelineWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void PipelineWorker::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      const auto events = source_->Fetch(task->channel);
      const auto report = pipeline_->Run(task->channel, events);
      if (sink_) sink_(report);
    } catch (const std::exception& e) {
      AIRTIME_LOG_ERROR("channel run failed",
                        {observability::IntField("channel_id", task->channel.id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace airtime::pipeline
