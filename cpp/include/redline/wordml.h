// cpp/include/redline/wordml.h
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <pugixml.hpp>

#include "redline/engine.h"
#include "redline/format_gate.h"
#include "redline/ir.h"

namespace redline {

constexpr const char* kDocumentPart = "word/document.xml";
constexpr const char* kCommentsPart = "word/comments.xml";
constexpr const char* kDocumentRelsPart = "word/_rels/document.xml.rels";
constexpr const char* kContentTypesPart = "[Content_Types].xml";

// Loaded package: every part's bytes in archive order plus the parsed main part.
class WordmlDom final : public DomHandle {
public:
    // throws RedlineException(Internal) when already closed
    void close() override;
    bool closed() const { return closed_; }

    // nullptr if absent
    const std::string* part(const std::string& path) const;

    pugi::xml_document document;
    std::vector<std::pair<std::string, std::string>> parts;

private:
    bool closed_{false};
};

class WordmlEditor final : public EditorHandle {
public:
    explicit WordmlEditor(std::shared_ptr<WordmlDom> dom);

    void destroy() override;
    std::string export_archive(const ExportOptions& opt) override;

    bool destroyed() const { return !dom_; }

    // throws RedlineException(Internal) after destroy()
    WordmlDom& dom();

    // Paragraph blocks of the loaded document, indexed on first use.
    const std::vector<Block>& blocks();

    // empty node if unknown
    pugi::xml_node node(const std::string& block_id);
    void bind(const std::string& block_id, pugi::xml_node p);

    bool is_deleted(const std::string& block_id) const { return deleted_.count(block_id) != 0; }
    void mark_deleted(const std::string& block_id) { deleted_.insert(block_id); }

    // shared by tracked changes and comments
    int next_change_id() { return next_id_++; }

private:
    void ensure_indexed();

    std::shared_ptr<WordmlDom> dom_;
    std::vector<Block> blocks_;
    std::unordered_map<std::string, pugi::xml_node> nodes_;
    std::unordered_set<std::string> deleted_;
    bool indexed_{false};
    int next_id_{1};
};

class WordmlEditorFactory final : public EditorFactory {
public:
    explicit WordmlEditorFactory(uint64_t max_inflated_bytes = kDefaultMaxDecompressedBytes)
        : max_inflated_bytes_(max_inflated_bytes) {}

    void create(const std::string& buffer, EditorParts& out) override;

private:
    uint64_t max_inflated_bytes_;
};

class WordmlIrExtractor final : public IrExtractor {
public:
    DocumentIR extract(EditorHandle& editor, const std::string& filename) override;
};

// Records every change as a tracked revision unless opt.track_changes is off.
class WordmlBlockMutator final : public BlockMutator {
public:
    MutationResult replace(EditorHandle& editor, const std::string& block_id,
                           const std::string& new_text, const MutationOptions& opt) override;
    MutationResult remove(EditorHandle& editor, const std::string& block_id,
                          const MutationOptions& opt) override;
    MutationResult insert_after(EditorHandle& editor, const std::string& anchor_block_id,
                                const std::string& text, const MutationOptions& opt) override;
    MutationResult add_comment(EditorHandle& editor, const std::string& block_id,
                               const std::string& text, const Author& author) override;
};

// Visible text of one w:p: w:t content, w:tab as '\t', w:br/w:cr as '\n',
// deleted runs excluded.
std::string paragraph_text(pugi::xml_node p);

// Token-level edit script between two strings, as hunks in old-text offsets.
struct DiffHunk {
    size_t old_pos{0};
    size_t old_len{0};
    std::string inserted;
};

// Word-level LCS. Falls back to one whole-text hunk when the inputs exceed max_cells.
std::vector<DiffHunk> word_diff(const std::string& before, const std::string& after,
                                size_t max_cells = 1000000);

} // namespace redline
