// cpp/service/service.cpp
#include "service.h"

#include <chrono>

RedlineService::RedlineService(const ServiceConfig& cfg)
    : cfg_(cfg),
      admission_(cfg.max_document_concurrency),
      factory_(cfg.max_decompressed_size) {
  pipeline_ = std::make_unique<redline::RequestPipeline>(
      pipeline_config(cfg_), admission_,
      redline::Engine{factory_, extractor_, mutator_}, deferred_);
}

RedlineService::RedlineService(const ServiceConfig& cfg, redline::Engine engine)
    : cfg_(cfg),
      admission_(cfg.max_document_concurrency),
      factory_(cfg.max_decompressed_size) {
  pipeline_ = std::make_unique<redline::RequestPipeline>(
      pipeline_config(cfg_), admission_, engine, deferred_);
}

redline::PipelineConfig RedlineService::pipeline_config(const ServiceConfig& cfg) {
  redline::PipelineConfig pc;
  pc.limits.max_ratio = cfg.max_bomb_ratio;
  pc.limits.max_absolute_bytes = cfg.max_decompressed_size;
  pc.admission_timeout = std::chrono::milliseconds(cfg.admission_timeout_ms);
  pc.repack.level = 9;
  pc.repack.max_inflated_bytes = cfg.max_decompressed_size;
  return pc;
}
