// cpp/include/redline/engine.h
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "redline/ir.h"

namespace redline {

struct Author {
    std::string name;
    std::string email;
};

struct MutationOptions {
    bool track_changes{true};
    bool diff{true};
    Author author;

    // insert_after only
    std::string block_type{"paragraph"};
    int level{0};
};

// Expected failures are reported here, not thrown.
struct MutationResult {
    bool success{false};
    std::string error;
    std::string new_block_id; // insert_after
    std::string comment_id;   // add_comment

    static MutationResult ok() {
        MutationResult r;
        r.success = true;
        return r;
    }
    static MutationResult fail(std::string msg) {
        MutationResult r;
        r.error = std::move(msg);
        return r;
    }
};

struct CommentRecord {
    std::string id;
    std::string block_id;
    std::string text;
    Author author;
};

struct ExportOptions {
    // false keeps tracked changes in the output; true accepts them
    bool final_doc{false};
    Author author;
    std::vector<CommentRecord> comments;
};

// Heavy object graph backing an editor. close() may be called from another thread.
class DomHandle {
public:
    virtual ~DomHandle() = default;
    virtual void close() = 0;
};

class EditorHandle {
public:
    virtual ~EditorHandle() = default;
    virtual void destroy() = 0;
    virtual std::string export_archive(const ExportOptions& opt) = 0;
};

// Filled in construction order. A factory that throws leaves whatever it
// already created in here so the caller can tear it down.
struct EditorParts {
    std::shared_ptr<DomHandle> dom;
    std::unique_ptr<EditorHandle> editor;
};

class EditorFactory {
public:
    virtual ~EditorFactory() = default;
    virtual void create(const std::string& buffer, EditorParts& out) = 0;
};

class IrExtractor {
public:
    virtual ~IrExtractor() = default;
    virtual DocumentIR extract(EditorHandle& editor, const std::string& filename) = 0;
};

class BlockMutator {
public:
    virtual ~BlockMutator() = default;

    virtual MutationResult replace(EditorHandle& editor, const std::string& block_id,
                                   const std::string& new_text, const MutationOptions& opt) = 0;
    virtual MutationResult remove(EditorHandle& editor, const std::string& block_id,
                                  const MutationOptions& opt) = 0;
    virtual MutationResult insert_after(EditorHandle& editor, const std::string& anchor_block_id,
                                        const std::string& text, const MutationOptions& opt) = 0;
    virtual MutationResult add_comment(EditorHandle& editor, const std::string& block_id,
                                       const std::string& text, const Author& author) = 0;
};

struct Engine {
    EditorFactory& factory;
    IrExtractor& extractor;
    BlockMutator& mutator;
};

} // namespace redline
