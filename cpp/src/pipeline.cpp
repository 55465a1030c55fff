// cpp/src/pipeline.cpp
#include "redline/pipeline.h"
#include "redline/session.h"

#include <exception>
#include <memory>

#include <spdlog/spdlog.h>

namespace redline {

RequestPipeline::RequestPipeline(PipelineConfig cfg, AdmissionController& admission,
                                 Engine engine, TaskQueue& deferred)
    : cfg_(std::move(cfg)), admission_(admission), engine_(engine), deferred_(deferred) {}

void RequestPipeline::gate(const std::string& buffer) const {
    const GateResult g = check_upload(buffer, cfg_.limits);
    if (!g.ok) {
        spdlog::info("pipeline: upload rejected ({}): {}", error_code_name(g.code), g.message);
        throw RedlineException(g.code, g.message);
    }
    spdlog::debug("pipeline: gate ok, ratio={:.2f} entries={}", g.ratio, g.entry_count);
}

AdmissionPermit RequestPipeline::admit() {
    if (!admission_.try_acquire_for(cfg_.admission_timeout)) {
        spdlog::warn("pipeline: no permit within {} ms ({} outstanding, {} waiting)",
                     cfg_.admission_timeout.count(), admission_.outstanding(), admission_.waiting());
        throw RedlineException(ErrorCode::Overloaded,
                               "Server is busy processing other documents, retry later");
    }
    return AdmissionPermit(admission_);
}

DocumentIR RequestPipeline::read(const std::string& filename, const std::string& buffer) {
    gate(buffer);

    // declared before the session: destroyed after it
    AdmissionPermit permit = admit();
    std::unique_ptr<DocumentSession> session =
        DocumentSession::create(engine_.factory, deferred_, buffer);

    DocumentIR ir;
    try {
        ir = engine_.extractor.extract(session->editor(), filename);
    } catch (const RedlineException&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("pipeline: extraction failed for {}: {}", filename, e.what());
        throw RedlineException(ErrorCode::SessionFailed, "Unable to extract document structure");
    }

    session->cleanup();
    permit.release();
    return ir;
}

ApplyResponse RequestPipeline::apply(const ApplyRequest& req, const std::string& buffer) {
    gate(buffer);

    AdmissionPermit permit = admit();
    std::unique_ptr<DocumentSession> session =
        DocumentSession::create(engine_.factory, deferred_, buffer);

    EditOrchestrator orchestrator(engine_.mutator);
    ApplyResponse resp;
    resp.dry_run = req.dry_run;

    DocumentIR ir;
    try {
        ir = engine_.extractor.extract(session->editor(), req.filename);
    } catch (const RedlineException&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("pipeline: extraction failed for {}: {}", req.filename, e.what());
        throw RedlineException(ErrorCode::SessionFailed, "Unable to load document");
    }

    if (req.dry_run || req.strict) {
        resp.validation = orchestrator.validate(req.edits, ir);
        if (req.dry_run) {
            session->cleanup();
            permit.release();
            return resp;
        }
        if (!resp.validation.valid) {
            throw InvalidEditsException(resp.validation);
        }
    }

    ApplyOptions opt;
    opt.author = cfg_.author;
    opt.final_doc = req.final_doc;

    ApplyResult result;
    try {
        result = orchestrator.apply(*session, req.edits, ir, opt);
    } catch (const std::exception& e) {
        spdlog::error("pipeline: apply failed for {}: {}", req.filename, e.what());
        throw RedlineException(ErrorCode::ApplyFailed, "Failed to apply edits to document");
    }
    session->cleanup();

    resp.validation = std::move(result.validation);
    resp.outcomes = std::move(result.outcomes);
    resp.summary = result.summary;

    try {
        resp.archive = repack(result.archive, cfg_.repack);
        resp.repacked = true;
    } catch (const RedlineException& e) {
        spdlog::warn("pipeline: {}, returning unpacked archive", e.what());
        resp.archive = std::move(result.archive);
    }

    permit.release();
    spdlog::info("pipeline: {} applied={} skipped={} failed={} warnings={} bytes={}",
                 req.filename, resp.summary.applied, resp.summary.skipped,
                 resp.summary.failed, resp.summary.warnings, resp.archive.size());
    return resp;
}

} // namespace redline
