#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "redline/admission.h"
#include "redline/errors.h"
#include "redline/pipeline.h"
#include "test_support.h"

using namespace redline;
using testutil::block;
using testutil::FakeExtractor;
using testutil::FakeFactory;
using testutil::FakeMutator;
using testutil::make_ir;
using testutil::ManualQueue;
using testutil::Counters;

// Builds a pipeline over fakes with a fresh controller per test.
struct Rig {
    Counters counts;
    FakeFactory factory{counts};
    FakeExtractor extractor;
    FakeMutator mutator;
    ManualQueue queue;
    AdmissionController admission;
    PipelineConfig cfg;

    explicit Rig(size_t capacity = 2) : admission(capacity) {
        cfg.admission_timeout = std::chrono::milliseconds(50);
        extractor.ir = make_ir({
            block("id-1", "b001", "First paragraph."),
            block("id-2", "b002", "Second paragraph."),
        });
    }

    RequestPipeline pipeline() {
        return RequestPipeline(cfg, admission, Engine{factory, extractor, mutator}, queue);
    }
};

static std::string small_docx() {
    return testutil::make_docx(testutil::para("First paragraph.") + testutil::para("Second paragraph."));
}

static EditOperation replace(const std::string& id, const std::string& text) {
    EditOperation e;
    e.kind = EditKind::Replace;
    e.operation = "replace";
    e.block_id = id;
    e.text = text;
    e.has_text = true;
    return e;
}

template <typename F>
static ErrorCode code_of(F&& f) {
    try {
        f();
    } catch (const RedlineException& e) {
        return e.code();
    }
    return ErrorCode::Ok;
}

static void test_gate_rejects_before_admission() {
    Rig rig;
    RequestPipeline p = rig.pipeline();

    assert(code_of([&] { p.read("x.pdf", "%PDF-1.7 not a docx"); }) == ErrorCode::InvalidFormat);
    assert(code_of([&] { p.read("x.docx", testutil::zip_with_ratio(10, 200.0)); }) == ErrorCode::BombSuspected);

    ApplyRequest req;
    req.edits = {replace("b001", "x")};
    assert(code_of([&] { p.apply(req, "PK"); }) == ErrorCode::InvalidFormat);

    assert(rig.counts.created == 0);
    assert(rig.admission.outstanding() == 0);
}

static void test_ratio_below_threshold_reaches_factory() {
    Rig rig;
    RequestPipeline p = rig.pipeline();
    DocumentIR ir = p.read("fifty.docx", testutil::zip_with_ratio(10, 50.0));
    assert(rig.counts.created == 1);
    assert(ir.filename == "fifty.docx");
    assert(ir.blocks.size() == 2);
    assert(rig.admission.outstanding() == 0);
}

static void test_factory_failure_releases_permit() {
    Rig rig;
    rig.factory.mode = FakeFactory::Mode::ThrowAfterDom;
    RequestPipeline p = rig.pipeline();

    for (int i = 0; i < 5; ++i) {
        assert(code_of([&] { p.read("a.docx", small_docx()); }) == ErrorCode::SessionFailed);
    }
    assert(rig.admission.outstanding() == 0);
    assert(rig.queue.run_all() == 5);
    assert(rig.counts.doms_closed == 5);
}

class ThrowingExtractor : public IrExtractor {
public:
    DocumentIR extract(EditorHandle&, const std::string&) override {
        throw std::runtime_error("no body element");
    }
};

static void test_extraction_failure() {
    Rig rig;
    ThrowingExtractor broken;
    RequestPipeline p(rig.cfg, rig.admission, Engine{rig.factory, broken, rig.mutator}, rig.queue);

    try {
        p.read("a.docx", small_docx());
        assert(false);
    } catch (const RedlineException& e) {
        assert(e.code() == ErrorCode::SessionFailed);
        assert(std::string(e.what()) == "Unable to extract document structure");
    }

    ApplyRequest req;
    req.edits = {replace("b001", "x")};
    try {
        p.apply(req, small_docx());
        assert(false);
    } catch (const RedlineException& e) {
        assert(e.code() == ErrorCode::SessionFailed);
        assert(std::string(e.what()) == "Unable to load document");
    }
    assert(rig.counts.editors_destroyed == 2);
    assert(rig.admission.outstanding() == 0);
}

static void test_admission_timeout() {
    Rig rig(1);
    RequestPipeline p = rig.pipeline();

    rig.admission.acquire();
    try {
        p.read("a.docx", small_docx());
        assert(false);
    } catch (const RedlineException& e) {
        assert(e.code() == ErrorCode::Overloaded);
        assert(testutil::contains(e.what(), "busy"));
    }
    assert(rig.counts.created == 0);
    rig.admission.release();

    p.read("a.docx", small_docx());
    assert(rig.admission.outstanding() == 0);
}

static void test_apply_success() {
    Rig rig;
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.filename = "contract.docx";
    req.edits = {replace("b001", "Changed."), replace("b404", "nope")};
    ApplyResponse r = p.apply(req, small_docx());

    assert(!r.dry_run);
    assert(r.repacked);
    assert(r.summary.applied == 1);
    assert(r.summary.skipped == 1);
    assert(r.outcomes.size() == 2);
    assert(testutil::entry(r.archive, "word/document.xml") ==
           testutil::entry(small_docx(), "word/document.xml"));
    assert(rig.counts.exports == 1);
    assert(rig.counts.last_export.author.name == "API User");
    assert(!rig.counts.last_export.final_doc);
    assert(rig.admission.outstanding() == 0);
    assert(rig.counts.editors_destroyed == 1);

    req.final_doc = true;
    p.apply(req, small_docx());
    assert(rig.counts.last_export.final_doc);
}

static void test_dry_run_touches_nothing() {
    Rig rig;
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.dry_run = true;
    req.edits = {replace("b001", "x"), replace("b777", "y")};
    ApplyResponse r = p.apply(req, small_docx());

    assert(r.dry_run);
    assert(r.archive.empty());
    assert(!r.validation.valid);
    assert(r.validation.summary.valid_edits == 1);
    assert(r.validation.issues[0].type == "missing_block");
    assert(rig.mutator.calls.empty());
    assert(rig.counts.exports == 0);
    assert(rig.admission.outstanding() == 0);
}

static void test_strict_rejects_whole_batch() {
    Rig rig;
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.strict = true;
    req.edits = {replace("b001", "x"), replace("b777", "y")};
    try {
        p.apply(req, small_docx());
        assert(false);
    } catch (const InvalidEditsException& e) {
        assert(e.code() == ErrorCode::InvalidEdits);
        assert(e.report().issues.size() == 1);
        assert(e.report().issues[0].edit_index == 1);
    }
    assert(rig.mutator.calls.empty());
    assert(rig.counts.editors_destroyed == 1);
    assert(rig.admission.outstanding() == 0);

    // a clean batch goes through in strict mode
    req.edits = {replace("b002", "y")};
    ApplyResponse r = p.apply(req, small_docx());
    assert(r.summary.applied == 1);
}

static void test_export_failure_is_sanitized() {
    Rig rig;
    rig.factory.fail_export = true;
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.edits = {replace("b001", "x")};
    try {
        p.apply(req, small_docx());
        assert(false);
    } catch (const RedlineException& e) {
        assert(e.code() == ErrorCode::ApplyFailed);
        assert(!testutil::contains(e.what(), "/tmp/secret"));
    }
    assert(rig.counts.editors_destroyed == 1);
    assert(rig.admission.outstanding() == 0);
}

static void test_repack_failure_falls_back() {
    Rig rig;
    rig.factory.export_bytes = "engine produced something odd";
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.edits = {replace("b001", "x")};
    ApplyResponse r = p.apply(req, small_docx());
    assert(!r.repacked);
    assert(r.archive == "engine produced something odd");
    assert(rig.admission.outstanding() == 0);
}

static void test_cleanup_precedes_release() {
    Rig rig;
    std::vector<size_t> seen;
    rig.counts.on_destroy = [&] { seen.push_back(rig.admission.outstanding()); };
    RequestPipeline p = rig.pipeline();

    ApplyRequest req;
    req.edits = {replace("b001", "x")};
    p.apply(req, small_docx());
    p.read("a.docx", small_docx());

    rig.factory.fail_export = true;
    assert(code_of([&] { p.apply(req, small_docx()); }) == ErrorCode::ApplyFailed);

    assert((seen == std::vector<size_t>{1, 1, 1}));
    assert(rig.admission.outstanding() == 0);
}

int main() {
    test_gate_rejects_before_admission();
    test_ratio_below_threshold_reaches_factory();
    test_factory_failure_releases_permit();
    test_extraction_failure();
    test_admission_timeout();
    test_apply_success();
    test_dry_run_touches_nothing();
    test_strict_rejects_whole_batch();
    test_export_failure_is_sanitized();
    test_repack_failure_falls_back();
    test_cleanup_precedes_release();
    return 0;
}
