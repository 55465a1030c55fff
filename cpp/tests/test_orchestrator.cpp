#include <cassert>
#include <string>
#include <vector>

#include "redline/edit.h"
#include "redline/orchestrator.h"
#include "redline/session.h"
#include "test_support.h"

using namespace redline;
using testutil::block;
using testutil::FakeFactory;
using testutil::FakeMutator;
using testutil::make_ir;
using testutil::ManualQueue;
using testutil::Counters;

static EditOperation replace(const std::string& id, const std::string& text) {
    EditOperation e;
    e.kind = EditKind::Replace;
    e.operation = "replace";
    e.block_id = id;
    e.text = text;
    e.has_text = true;
    return e;
}

static EditOperation del(const std::string& id) {
    EditOperation e;
    e.kind = EditKind::Delete;
    e.operation = "delete";
    e.block_id = id;
    return e;
}

static EditOperation insert(const std::string& after, const std::string& text) {
    EditOperation e;
    e.kind = EditKind::Insert;
    e.operation = "insert";
    e.block_id = after;
    e.text = text;
    e.has_text = true;
    return e;
}

static EditOperation comment(const std::string& id, const std::string& text) {
    EditOperation e;
    e.kind = EditKind::Comment;
    e.operation = "comment";
    e.block_id = id;
    e.comment = text;
    return e;
}

static DocumentIR sample_ir() {
    return make_ir({
        block("id-1", "b001", "Contents", "heading"),
        block("id-2", "b002", "Introduction ........ 1", "paragraph", "TOC1"),
        block("id-3", "b003", "Scope ........ 4", "paragraph", "TOC1"),
        block("id-4", "b004", "The parties agree as follows."),
        block("id-5", "b005", "Payment is due in 30 days."),
        block("id-6", "b006", "Governing law is Delaware."),
    });
}

struct Harness {
    Counters counts;
    FakeFactory factory{counts};
    ManualQueue queue;
    FakeMutator mutator;
    std::unique_ptr<DocumentSession> session;

    Harness() { session = DocumentSession::create(factory, queue, "archive-bytes"); }

    ApplyResult run(const std::vector<EditOperation>& edits, const DocumentIR& ir) {
        EditOrchestrator orch(mutator);
        ApplyOptions opt;
        opt.author = Author{"API User", "api@superdoc.com"};
        return orch.apply(*session, edits, ir, opt);
    }
};

static void test_protected_detection() {
    assert(looks_like_toc_entry("Introduction ........ 1"));
    assert(looks_like_toc_entry("Scope\t12"));
    assert(looks_like_toc_entry("Preface . . . . iv"));
    assert(!looks_like_toc_entry("Paid within 30 days"));
    assert(!looks_like_toc_entry("12"));
    assert(!looks_like_toc_entry(""));

    // a single dotted line among body text is not a table of contents
    DocumentIR lone = make_ir({
        block("a", "b001", "Plain text."),
        block("b", "b002", "Total ........ 5"),
        block("c", "b003", "More text."),
    });
    std::vector<bool> flags = detect_protected_blocks(lone);
    assert(!flags[0] && !flags[1] && !flags[2]);

    DocumentIR run = make_ir({
        block("a", "b001", "Chapter one ..... 1"),
        block("b", "b002", "Chapter two ..... 9"),
        block("c", "b003", "Body."),
        block("d", "b004", "Generated", "toc"),
    });
    flags = detect_protected_blocks(run);
    assert(flags[0] && flags[1] && !flags[2] && flags[3]);
}

static void test_resolution_and_partial_failure() {
    Harness h;
    DocumentIR ir = sample_ir();

    // short id, durable id, and a missing block in one batch
    std::vector<EditOperation> edits = {
        replace("b004", "The parties agree."),
        replace("id-5", "Payment is due in 45 days."),
        replace("b999", "nothing"),
    };
    ApplyResult r = h.run(edits, ir);

    assert(r.outcomes.size() == 3);
    assert(r.outcomes[0].outcome == OutcomeKind::Applied);
    assert(r.outcomes[0].resolved_id == "id-4");
    assert(r.outcomes[1].outcome == OutcomeKind::Applied);
    assert(r.outcomes[2].outcome == OutcomeKind::SkippedNotFound);
    assert(r.summary.applied == 2);
    assert(r.summary.skipped == 1);
    assert(r.summary.failed == 0);
    assert(r.archive == "archive-bytes");
    assert(h.counts.exports == 1);
    assert((h.mutator.calls == std::vector<std::string>{"replace:id-4", "replace:id-5"}));
    assert(h.mutator.last_opt.track_changes);
    assert(h.mutator.last_opt.author.name == "API User");
}

static void test_protected_blocks_untouched() {
    Harness h;
    DocumentIR ir = sample_ir();
    std::vector<EditOperation> edits = {
        replace("b002", "Overview ..... 1"),
        del("b003"),
        insert("b003", "New entry"),
        comment("b002", "Regenerate the TOC"),
        del("b006"),
    };
    ApplyResult r = h.run(edits, ir);

    assert(r.outcomes[0].outcome == OutcomeKind::SkippedProtected);
    assert(r.outcomes[1].outcome == OutcomeKind::SkippedProtected);
    assert(r.outcomes[2].outcome == OutcomeKind::SkippedProtected);
    assert(r.outcomes[3].outcome == OutcomeKind::Applied);
    assert(r.outcomes[4].outcome == OutcomeKind::Applied);
    assert((h.mutator.calls == std::vector<std::string>{"comment:id-2", "delete:id-6"}));
    assert(r.validation.warnings.size() == 3);
    assert(r.validation.warnings[0].type == "toc_block");
}

static void test_fault_isolation() {
    Harness h;
    h.mutator.throw_ids = {"id-4"};
    h.mutator.fail_ids = {"id-5"};
    DocumentIR ir = sample_ir();
    std::vector<EditOperation> edits = {
        replace("b004", "x"),
        replace("b005", "y"),
        replace("b006", "z"),
    };
    ApplyResult r = h.run(edits, ir);

    assert(r.outcomes[0].outcome == OutcomeKind::Failed);
    assert(testutil::contains(r.outcomes[0].reason, "engine fault"));
    assert(r.outcomes[1].outcome == OutcomeKind::Failed);
    assert(r.outcomes[1].reason == "primitive refused id-5");
    assert(r.outcomes[2].outcome == OutcomeKind::Applied);
    assert(r.summary.failed == 2);
    assert(r.summary.applied == 1);
    assert(h.counts.exports == 1);
}

static void test_ordering_within_a_block() {
    Harness h;
    DocumentIR ir = sample_ir();
    std::vector<EditOperation> edits = {
        del("b004"),            // 0
        replace("b006", "z"),   // 1, unrelated block keeps its slot
        insert("b004", "after"),// 2
        replace("b004", "new"), // 3
        comment("b004", "why"), // 4
    };

    EditOrchestrator orch(h.mutator);
    std::vector<size_t> order = orch.application_order(edits, ir);
    assert((order == std::vector<size_t>{3, 1, 4, 2, 0}));

    h.run(edits, ir);
    assert((h.mutator.calls == std::vector<std::string>{
        "replace:id-4", "replace:id-6", "comment:id-4", "insert:id-4", "delete:id-4"}));
}

static void test_inserts_keep_caller_order() {
    Harness h;
    DocumentIR ir = sample_ir();
    std::vector<EditOperation> edits = {
        insert("b005", "first"),
        insert("b005", "second"),
        insert("b005", "third"),
    };
    ApplyResult r = h.run(edits, ir);
    assert((h.mutator.calls == std::vector<std::string>{"insert:id-5", "insert:new-1", "insert:new-2"}));
    assert(r.outcomes[2].new_block_id == "new-3");
}

static void test_comments_attach_after_success() {
    Harness h;
    DocumentIR ir = sample_ir();
    EditOperation e = replace("b004", "changed");
    e.comment = "tightened wording";
    EditOperation ins = insert("b005", "added");
    ins.comment = "new clause";
    EditOperation bad = replace("b999", "x");
    bad.comment = "never attached";

    ApplyResult r = h.run({e, ins, bad}, ir);
    assert(r.outcomes[0].comment_attached);
    assert(r.outcomes[1].comment_attached);
    assert((h.mutator.calls == std::vector<std::string>{
        "replace:id-4", "comment:id-4", "insert:id-5", "comment:new-1"}));

    const ExportOptions& ex = h.counts.last_export;
    assert(!ex.final_doc);
    assert(ex.author.name == "API User");
    assert(ex.comments.size() == 2);
    assert(ex.comments[1].block_id == "new-1");
    assert(ex.comments[1].text == "new clause");
}

static void test_comment_failure_keeps_primary() {
    Harness h;
    h.mutator.fail_comments = true;
    DocumentIR ir = sample_ir();
    EditOperation e = replace("b004", "changed");
    e.comment = "note";
    ApplyResult r = h.run({e}, ir);
    assert(r.outcomes[0].outcome == OutcomeKind::Applied);
    assert(!r.outcomes[0].comment_attached);
    assert(r.summary.applied == 1);
    assert(r.summary.warnings == 1);
    assert(h.counts.last_export.comments.empty());
}

static void test_dry_run_report() {
    FakeMutator mutator;
    EditOrchestrator orch(mutator);
    DocumentIR ir = sample_ir();

    EditOperation no_text = replace("b004", "");
    no_text.has_text = false;
    EditOperation unknown;
    unknown.operation = "rewrite";
    unknown.block_id = "b004";

    std::vector<EditOperation> edits = {
        replace("b004", "ok"),
        replace("b005", "ok"),
        replace("b404", "missing"),
        no_text,
        unknown,
        del("b004"),
    };
    ValidationReport r = orch.validate(edits, ir);
    assert(!r.valid);
    assert(r.summary.total_edits == 6);
    assert(r.summary.valid_edits == 3);
    assert(r.summary.invalid_edits == 3);
    assert(r.issues[0].type == "missing_block");
    assert(r.issues[0].edit_index == 2);
    assert(r.issues[1].type == "missing_field");
    assert(r.issues[2].type == "invalid_operation");
    assert(r.summary.warning_count == 1);
    assert(r.warnings[0].type == "duplicate_target");
    assert(mutator.calls.empty());

    nlohmann::json j = to_json(r);
    assert(j["valid"] == false);
    assert(j["summary"]["validEdits"] == 3);
    assert(j["issues"][0]["blockId"] == "b404");
    assert(j["issues"][0]["editIndex"] == 2);

    ValidationReport clean = orch.validate({replace("b004", "a"), comment("b005", "b")}, ir);
    assert(clean.valid);
    assert(clean.summary.valid_edits == 2);
    assert(clean.summary.invalid_edits == 0);
}

static void test_parse_edits() {
    auto j = nlohmann::json::parse(R"([
        {"operation":"replace","blockId":"b001","newText":"Hi","diff":false},
        {"operation":"insert","afterBlockId":"b002","text":"T","type":"heading","level":2,"comment":"c"},
        {"operation":"delete","blockId":"b003"},
        {"operation":"comment","blockId":"b004","comment":"look"},
        {"blockId":"b005"},
        42
    ])");
    std::vector<EditOperation> edits = parse_edits(j);
    assert(edits.size() == 6);
    assert(edits[0].kind == EditKind::Replace && !edits[0].diff && edits[0].has_text);
    assert(edits[1].kind == EditKind::Insert && edits[1].block_id == "b002");
    assert(edits[1].insert_type == "heading" && edits[1].level == 2 && edits[1].comment == "c");
    assert(edits[2].kind == EditKind::Delete);
    assert(edits[3].comment == "look");
    assert(edits[4].kind == EditKind::Unknown && edits[4].operation.empty());
    assert(edits[5].kind == EditKind::Unknown);

    bool threw = false;
    try {
        parse_edits(nlohmann::json::object());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // out-of-range levels clamp instead of wrapping
    auto levels = nlohmann::json::parse(R"([
        {"operation":"insert","afterBlockId":"b001","text":"x","level":4294967298},
        {"operation":"insert","afterBlockId":"b001","text":"x","level":-7}
    ])");
    std::vector<EditOperation> clamped = parse_edits(levels);
    assert(clamped[0].level == 9);
    assert(clamped[1].level == 0);
}

int main() {
    test_protected_detection();
    test_resolution_and_partial_failure();
    test_protected_blocks_untouched();
    test_fault_isolation();
    test_ordering_within_a_block();
    test_inserts_keep_caller_order();
    test_comments_attach_after_success();
    test_comment_failure_keeps_primary();
    test_dry_run_report();
    test_parse_edits();
    return 0;
}
