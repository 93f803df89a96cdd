#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "internal/ingest/recognition_source.hpp"
#include "internal/pipeline/channel_pipeline.hpp"
#include "pipeline_scheduler.hpp"

namespace airtime::pipeline {

/*
  Background worker that runs channel pipelines.

  fetch events -> ChannelPipeline::Run -> report sink
  A failing channel is logged; the worker moves on to the next task.
*/
class PipelineWorker {
 public:
  using ReportSink = std::function<void(const RunReport&)>;

  PipelineWorker(std::shared_ptr<PipelineScheduler> scheduler, std::shared_ptr<ChannelPipeline> pipeline,
                 std::shared_ptr<ingest::RecognitionSource> source, ReportSink sink = {});
  ~PipelineWorker();

  void Start();

  // Drains the queue, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<PipelineScheduler>         scheduler_;
  std::shared_ptr<ChannelPipeline>           pipeline_;
  std::shared_ptr<ingest::RecognitionSource> source_;
  ReportSink                                 sink_;

  std::thread thread_;
};

} // namespace airtime::pipeline
