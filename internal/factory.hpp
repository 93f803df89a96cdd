#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/ingest/recognition_source.hpp"
#include "internal/model/channel_settings.hpp"
#include "internal/pipeline/channel_pipeline.hpp"
#include "internal/pipeline/pipeline_scheduler.hpp"
#include "internal/pipeline/pipeline_worker.hpp"
#include "internal/pipeline/transcription_submitter.hpp"

namespace airtime::factory {

/*
  Application

  Owns all long-lived objects of one process. Workers are started by
  Build() and drain the scheduler on Stop().
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::vector<model::ChannelSettings>     channels;
  std::shared_ptr<pipeline::ChannelPipeline> pipeline;

  std::shared_ptr<pipeline::PipelineScheduler>           scheduler;
  std::vector<std::shared_ptr<pipeline::PipelineWorker>> workers;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const airtime::runtime::config::RuntimeConfig& config);

Application Build(const airtime::runtime::config::RuntimeConfig& config, std::shared_ptr<ingest::RecognitionSource> source,
                  std::shared_ptr<pipeline::TranscriptionSubmitter> submitter, pipeline::PipelineWorker::ReportSink sink = {});

} // namespace airtime::factory
