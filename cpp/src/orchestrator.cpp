// cpp/src/orchestrator.cpp
#include "redline/orchestrator.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace redline {

namespace {

bool mutates_target(EditKind k) {
    return k == EditKind::Replace || k == EditKind::Delete || k == EditKind::Insert;
}

int kind_rank(EditKind k) {
    switch (k) {
        case EditKind::Replace: return 0;
        case EditKind::Comment: return 1;
        case EditKind::Insert:  return 2;
        case EditKind::Delete:  return 3;
        case EditKind::Unknown: return 4;
    }
    return 4;
}

bool starts_with_ci(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i]; ++i) {
        if (i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) return false;
    }
    return true;
}

struct Classified {
    const Block* block{nullptr};
    bool protected_block{false};
    std::string issue_type; // empty means valid
    std::string issue_message;
};

std::vector<Classified> classify(const std::vector<EditOperation>& edits, const DocumentIR& ir) {
    const std::vector<bool> prot = detect_protected_blocks(ir);

    std::vector<Classified> out(edits.size());
    for (size_t i = 0; i < edits.size(); ++i) {
        const EditOperation& e = edits[i];
        Classified& c = out[i];

        if (e.kind == EditKind::Unknown) {
            if (e.operation.empty()) {
                c.issue_type = "missing_field";
                c.issue_message = "operation is required";
            } else {
                c.issue_type = "invalid_operation";
                c.issue_message = "Unknown operation: " + e.operation;
            }
            continue;
        }
        if (e.block_id.empty()) {
            c.issue_type = "missing_field";
            c.issue_message = e.kind == EditKind::Insert ? "afterBlockId is required"
                                                         : "blockId is required";
            continue;
        }

        c.block = ir.resolve(e.block_id);
        if (c.block) {
            c.protected_block = prot[static_cast<size_t>(c.block - ir.blocks.data())];
        }

        if (e.kind == EditKind::Replace && !e.has_text) {
            c.issue_type = "missing_field";
            c.issue_message = "newText is required";
        } else if (e.kind == EditKind::Insert && !e.has_text) {
            c.issue_type = "missing_field";
            c.issue_message = "text is required";
        } else if (e.kind == EditKind::Comment && e.comment.empty()) {
            c.issue_type = "missing_field";
            c.issue_message = "comment is required";
        } else if (!c.block) {
            c.issue_type = "missing_block";
            c.issue_message = "Block not found: " + e.block_id;
        }
    }
    return out;
}

ValidationReport build_report(const std::vector<EditOperation>& edits,
                              const std::vector<Classified>& cls) {
    ValidationReport r;
    r.summary.total_edits = edits.size();

    std::unordered_set<std::string> rewritten;
    for (size_t i = 0; i < edits.size(); ++i) {
        const EditOperation& e = edits[i];
        const Classified& c = cls[i];

        if (!c.issue_type.empty()) {
            r.issues.push_back(EditIssue{i, e.block_id, c.issue_type, c.issue_message});
            continue;
        }

        if (c.protected_block && mutates_target(e.kind)) {
            r.warnings.push_back(EditIssue{i, e.block_id, "toc_block",
                "Block " + e.block_id + " is part of a table of contents and will not be modified"});
        }
        if (e.kind == EditKind::Replace || e.kind == EditKind::Delete) {
            if (!rewritten.insert(c.block->id).second) {
                r.warnings.push_back(EditIssue{i, e.block_id, "duplicate_target",
                    "Block " + e.block_id + " is targeted by multiple edits"});
            }
        }
    }

    r.summary.invalid_edits = r.issues.size();
    r.summary.valid_edits = r.summary.total_edits - r.summary.invalid_edits;
    r.summary.warning_count = r.warnings.size();
    r.valid = r.issues.empty();
    return r;
}

std::vector<size_t> order_edits(const std::vector<EditOperation>& edits,
                                const std::vector<Classified>& cls) {
    std::vector<size_t> order(edits.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;

    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < edits.size(); ++i) {
        if (cls[i].block) groups[cls[i].block->id].push_back(i);
    }

    for (auto& kv : groups) {
        const std::vector<size_t>& slots = kv.second;
        if (slots.size() < 2) continue;

        std::vector<size_t> sorted = slots;
        std::stable_sort(sorted.begin(), sorted.end(), [&](size_t a, size_t b) {
            return kind_rank(edits[a].kind) < kind_rank(edits[b].kind);
        });
        for (size_t k = 0; k < slots.size(); ++k) order[slots[k]] = sorted[k];
    }
    return order;
}

} // namespace

const char* outcome_kind_name(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::Applied:          return "applied";
        case OutcomeKind::SkippedNotFound:  return "skipped_not_found";
        case OutcomeKind::SkippedProtected: return "skipped_protected";
        case OutcomeKind::SkippedInvalid:   return "skipped_invalid";
        case OutcomeKind::Failed:           return "failed";
    }
    return "failed";
}

bool looks_like_toc_entry(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    size_t p = end;
    while (p > 0 && std::isdigit(static_cast<unsigned char>(text[p - 1]))) --p;
    if (p == end) {
        // roman numerals for front matter
        while (p > 0 && text[p - 1] != '\0' && std::strchr("ivxlcIVXLC", text[p - 1]) != nullptr) --p;
        if (p == end) return false;
    }

    size_t q = p;
    while (q > 0 && text[q - 1] == ' ') --q;

    if (q > 0 && text[q - 1] == '\t') return q > 1;

    size_t dots = 0;
    while (q > 0 && (text[q - 1] == '.' || text[q - 1] == ' ')) {
        if (text[q - 1] == '.') ++dots;
        --q;
    }
    // U+2026 HORIZONTAL ELLIPSIS
    while (q >= 3 && static_cast<unsigned char>(text[q - 3]) == 0xE2 &&
           static_cast<unsigned char>(text[q - 2]) == 0x80 &&
           static_cast<unsigned char>(text[q - 1]) == 0xA6) {
        dots += 3;
        q -= 3;
    }
    return dots >= 3 && q > 0;
}

std::vector<bool> detect_protected_blocks(const DocumentIR& ir) {
    const size_t n = ir.blocks.size();
    std::vector<bool> flags(n, false);

    for (size_t i = 0; i < n; ++i) {
        const Block& b = ir.blocks[i];
        if (b.type == "toc" || starts_with_ci(b.style_id, "toc")) flags[i] = true;
    }

    // a lone dotted line is not enough, a run of two or more is
    size_t i = 0;
    while (i < n) {
        if (!looks_like_toc_entry(ir.blocks[i].text)) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < n && looks_like_toc_entry(ir.blocks[j].text)) ++j;
        if (j - i >= 2) {
            for (size_t k = i; k < j; ++k) flags[k] = true;
        }
        i = j;
    }
    return flags;
}

ValidationReport EditOrchestrator::validate(const std::vector<EditOperation>& edits,
                                            const DocumentIR& ir) const {
    return build_report(edits, classify(edits, ir));
}

std::vector<size_t> EditOrchestrator::application_order(const std::vector<EditOperation>& edits,
                                                        const DocumentIR& ir) const {
    return order_edits(edits, classify(edits, ir));
}

ApplyResult EditOrchestrator::apply(DocumentSession& session,
                                    const std::vector<EditOperation>& edits,
                                    const DocumentIR& ir,
                                    const ApplyOptions& opt) {
    EditorHandle& editor = session.editor();
    const std::vector<Classified> cls = classify(edits, ir);

    ApplyResult r;
    r.validation = build_report(edits, cls);
    r.outcomes.resize(edits.size());

    // anchor durable id -> most recent block inserted after it
    std::unordered_map<std::string, std::string> insert_tail;
    std::vector<CommentRecord> comments;
    size_t comment_warnings = 0;

    MutationOptions base;
    base.author = opt.author;

    for (size_t idx : order_edits(edits, cls)) {
        const EditOperation& e = edits[idx];
        const Classified& c = cls[idx];
        ApplyOutcome& out = r.outcomes[idx];
        out.edit_index = idx;
        out.kind = e.kind;
        out.block_id = e.block_id;
        if (c.block) out.resolved_id = c.block->id;

        if (!c.issue_type.empty()) {
            out.outcome = c.issue_type == "missing_block" ? OutcomeKind::SkippedNotFound
                                                          : OutcomeKind::SkippedInvalid;
            out.reason = c.issue_message;
            continue;
        }
        if (c.protected_block && mutates_target(e.kind)) {
            out.outcome = OutcomeKind::SkippedProtected;
            out.reason = "table of contents block";
            continue;
        }

        const std::string& id = c.block->id;
        MutationResult m;
        try {
            switch (e.kind) {
                case EditKind::Replace: {
                    MutationOptions mo = base;
                    mo.diff = e.diff;
                    m = mutator_.replace(editor, id, e.text, mo);
                    break;
                }
                case EditKind::Delete:
                    m = mutator_.remove(editor, id, base);
                    break;
                case EditKind::Insert: {
                    MutationOptions mo = base;
                    mo.block_type = e.insert_type;
                    mo.level = e.level;
                    auto tail = insert_tail.find(id);
                    const std::string& anchor = tail != insert_tail.end() ? tail->second : id;
                    m = mutator_.insert_after(editor, anchor, e.text, mo);
                    if (m.success && !m.new_block_id.empty()) insert_tail[id] = m.new_block_id;
                    break;
                }
                case EditKind::Comment:
                    m = mutator_.add_comment(editor, id, e.comment, opt.author);
                    if (m.success) {
                        comments.push_back(CommentRecord{m.comment_id, id, e.comment, opt.author});
                    }
                    break;
                case EditKind::Unknown:
                    m = MutationResult::fail("unknown operation");
                    break;
            }
        } catch (const std::exception& ex) {
            m = MutationResult::fail(ex.what());
        }

        if (!m.success) {
            out.outcome = OutcomeKind::Failed;
            out.reason = m.error.empty() ? "unknown error" : m.error;
            spdlog::warn("orchestrator: edit {} ({}) failed on {}: {}",
                         idx, edit_kind_name(e.kind), e.block_id, out.reason);
            continue;
        }
        out.outcome = OutcomeKind::Applied;
        out.new_block_id = m.new_block_id;

        if (e.kind == EditKind::Comment || e.comment.empty()) continue;

        const std::string& target = e.kind == EditKind::Insert ? m.new_block_id : id;
        if (target.empty()) {
            ++comment_warnings;
            continue;
        }
        try {
            MutationResult cm = mutator_.add_comment(editor, target, e.comment, opt.author);
            if (cm.success) {
                comments.push_back(CommentRecord{cm.comment_id, target, e.comment, opt.author});
                out.comment_attached = true;
            } else {
                ++comment_warnings;
                spdlog::warn("orchestrator: comment on edit {} not attached: {}", idx, cm.error);
            }
        } catch (const std::exception& ex) {
            ++comment_warnings;
            spdlog::warn("orchestrator: comment on edit {} not attached: {}", idx, ex.what());
        }
    }

    for (const ApplyOutcome& o : r.outcomes) {
        switch (o.outcome) {
            case OutcomeKind::Applied: ++r.summary.applied; break;
            case OutcomeKind::Failed:  ++r.summary.failed; break;
            default:                   ++r.summary.skipped; break;
        }
    }
    r.summary.warnings = r.validation.summary.warning_count + comment_warnings;

    ExportOptions eo;
    eo.final_doc = opt.final_doc;
    eo.author = opt.author;
    eo.comments = std::move(comments);
    r.archive = editor.export_archive(eo);
    return r;
}

nlohmann::json to_json(const EditIssue& i) {
    nlohmann::json j;
    j["editIndex"] = i.edit_index;
    if (i.block_id.empty()) j["blockId"] = nullptr;
    else j["blockId"] = i.block_id;
    j["type"] = i.type;
    j["message"] = i.message;
    return j;
}

nlohmann::json to_json(const ValidationReport& r) {
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& i : r.issues) issues.push_back(to_json(i));
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : r.warnings) warnings.push_back(to_json(w));

    return {
        {"valid", r.valid},
        {"summary", {
            {"totalEdits", r.summary.total_edits},
            {"validEdits", r.summary.valid_edits},
            {"invalidEdits", r.summary.invalid_edits},
            {"warningCount", r.summary.warning_count},
        }},
        {"issues", issues},
        {"warnings", warnings},
    };
}

nlohmann::json to_json(const ApplyOutcome& o) {
    nlohmann::json j;
    j["editIndex"] = o.edit_index;
    j["operation"] = edit_kind_name(o.kind);
    j["blockId"] = o.block_id;
    j["outcome"] = outcome_kind_name(o.outcome);
    if (!o.reason.empty()) j["reason"] = o.reason;
    if (!o.new_block_id.empty()) j["newBlockId"] = o.new_block_id;
    return j;
}

} // namespace redline
