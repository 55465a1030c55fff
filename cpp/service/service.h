// cpp/service/service.h
#pragma once

#include <memory>
#include <string>

#include "config.h"

#include "redline/admission.h"
#include "redline/engine.h"
#include "redline/pipeline.h"
#include "redline/task_queue.h"
#include "redline/wordml.h"

// Process-wide state behind the HTTP routes: one admission controller, one
// deferred queue, one pipeline. Everything else is per request.
class RedlineService {
public:
  // WordprocessingML engine
  explicit RedlineService(const ServiceConfig& cfg);

  // caller-supplied engine, for tests
  RedlineService(const ServiceConfig& cfg, redline::Engine engine);

  const ServiceConfig& config() const { return cfg_; }
  redline::RequestPipeline& pipeline() { return *pipeline_; }
  redline::AdmissionController& admission() { return admission_; }
  redline::DeferredQueue& deferred() { return deferred_; }

private:
  static redline::PipelineConfig pipeline_config(const ServiceConfig& cfg);

  ServiceConfig cfg_;
  redline::DeferredQueue deferred_;
  redline::AdmissionController admission_;

  redline::WordmlEditorFactory factory_;
  redline::WordmlIrExtractor extractor_;
  redline::WordmlBlockMutator mutator_;

  std::unique_ptr<redline::RequestPipeline> pipeline_;
};
