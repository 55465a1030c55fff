// cpp/include/redline/pipeline.h
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "redline/admission.h"
#include "redline/edit.h"
#include "redline/engine.h"
#include "redline/errors.h"
#include "redline/format_gate.h"
#include "redline/ir.h"
#include "redline/orchestrator.h"
#include "redline/repack.h"
#include "redline/task_queue.h"

namespace redline {

struct PipelineConfig {
    GateLimits limits;
    std::chrono::milliseconds admission_timeout{30000};
    RepackOptions repack;
    Author author{"API User", "api@superdoc.com"};
};

struct ApplyRequest {
    std::string filename;
    std::vector<EditOperation> edits;
    bool dry_run{false};
    bool strict{false};
    bool final_doc{false};
};

struct ApplyResponse {
    bool dry_run{false};
    ValidationReport validation;

    // empty for dry runs
    std::string archive;
    std::vector<ApplyOutcome> outcomes;
    ApplySummary summary;
    bool repacked{false};
};

// Strict mode rejection; carries the issues found.
class InvalidEditsException : public RedlineException {
public:
    explicit InvalidEditsException(ValidationReport report)
        : RedlineException(ErrorCode::InvalidEdits, "One or more edits are invalid"),
          report_(std::move(report)) {}

    const ValidationReport& report() const { return report_; }

private:
    ValidationReport report_;
};

// gate -> admit -> session -> orchestrate -> repack -> release
//
// Rejections from the gate never touch the admission controller. Once a permit
// is held, every exit path cleans up the session before the permit goes back.
class RequestPipeline {
public:
    RequestPipeline(PipelineConfig cfg, AdmissionController& admission,
                    Engine engine, TaskQueue& deferred);

    // throws RedlineException
    DocumentIR read(const std::string& filename, const std::string& buffer);

    // throws RedlineException, InvalidEditsException in strict mode
    ApplyResponse apply(const ApplyRequest& req, const std::string& buffer);

    const PipelineConfig& config() const { return cfg_; }

private:
    void gate(const std::string& buffer) const;
    AdmissionPermit admit();

    PipelineConfig cfg_;
    AdmissionController& admission_;
    Engine engine_;
    TaskQueue& deferred_;
};

} // namespace redline
