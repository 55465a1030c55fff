// cpp/include/redline/orchestrator.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "redline/edit.h"
#include "redline/engine.h"
#include "redline/ir.h"
#include "redline/session.h"

namespace redline {

enum class OutcomeKind {
    Applied,
    SkippedNotFound,
    SkippedProtected,
    SkippedInvalid,
    Failed,
};

const char* outcome_kind_name(OutcomeKind k);

struct ApplyOutcome {
    size_t edit_index{0};
    EditKind kind{EditKind::Unknown};
    OutcomeKind outcome{OutcomeKind::Failed};
    std::string block_id;     // as sent
    std::string resolved_id;  // durable id, empty when unresolved
    std::string reason;
    std::string new_block_id; // Insert
    bool comment_attached{false};
};

struct EditIssue {
    size_t edit_index{0};
    std::string block_id;
    std::string type;
    std::string message;
};

struct ValidationSummary {
    size_t total_edits{0};
    size_t valid_edits{0};
    size_t invalid_edits{0};
    size_t warning_count{0};
};

struct ValidationReport {
    bool valid{true};
    ValidationSummary summary;
    std::vector<EditIssue> issues;
    std::vector<EditIssue> warnings;
};

struct ApplySummary {
    size_t applied{0};
    size_t skipped{0};
    size_t failed{0};
    size_t warnings{0};
};

struct ApplyResult {
    std::string archive;
    std::vector<ApplyOutcome> outcomes; // indexed like the input edits
    ApplySummary summary;
    ValidationReport validation;
};

struct ApplyOptions {
    Author author;
    bool final_doc{false};
};

// Table-of-contents heuristic over block type, style and content.
// Result is indexed like ir.blocks.
std::vector<bool> detect_protected_blocks(const DocumentIR& ir);

// "Heading ....... 12" or "Heading<TAB>12"
bool looks_like_toc_entry(const std::string& text);

class EditOrchestrator {
public:
    explicit EditOrchestrator(BlockMutator& mutator) : mutator_(mutator) {}

    // Dry run: resolution and classification only, no mutation.
    ValidationReport validate(const std::vector<EditOperation>& edits, const DocumentIR& ir) const;

    // Permutation of edit indices. Edits on the same block are reordered among
    // their own slots (replace, comment, insert, delete); every other edit
    // keeps its position.
    std::vector<size_t> application_order(const std::vector<EditOperation>& edits,
                                          const DocumentIR& ir) const;

    // Applies every resolvable, unprotected edit and exports the archive.
    // Per-edit failures end up in outcomes; export failures throw.
    ApplyResult apply(DocumentSession& session,
                      const std::vector<EditOperation>& edits,
                      const DocumentIR& ir,
                      const ApplyOptions& opt);

private:
    BlockMutator& mutator_;
};

nlohmann::json to_json(const EditIssue& i);
nlohmann::json to_json(const ValidationReport& r);
nlohmann::json to_json(const ApplyOutcome& o);

} // namespace redline
