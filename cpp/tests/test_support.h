// cpp/tests/test_support.h
#pragma once
#include <atomic>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "redline/engine.h"
#include "redline/errors.h"
#include "redline/ir.h"
#include "redline/task_queue.h"
#include "redline/zip_io.h"

namespace testutil {

using Entries = std::vector<std::pair<std::string, std::string>>;

inline std::string make_zip(const Entries& entries, int level = 6) {
    redline::ZipWriter w;
    for (const auto& e : entries) w.add(e.first, e.second, level);
    return w.finish();
}

inline uint32_t rd32(const std::string& s, size_t off) {
    return (uint32_t)(unsigned char)s[off] | ((uint32_t)(unsigned char)s[off + 1] << 8) |
           ((uint32_t)(unsigned char)s[off + 2] << 16) | ((uint32_t)(unsigned char)s[off + 3] << 24);
}

inline uint16_t rd16(const std::string& s, size_t off) {
    return (uint16_t)((unsigned char)s[off] | ((unsigned char)s[off + 1] << 8));
}

inline void wr32(std::string& s, size_t off, uint32_t v) {
    for (int i = 0; i < 4; ++i) s[off + i] = (char)((v >> (8 * i)) & 0xFF);
}

// Rewrites the uncompressed-size field of every central directory record.
// Local headers and payloads stay untouched.
inline std::string forge_declared_sizes(std::string zip, uint32_t declared) {
    size_t eocd = zip.rfind(std::string("PK\x05\x06", 4));
    if (eocd == std::string::npos) throw std::runtime_error("no end of central directory");

    const uint16_t count = rd16(zip, eocd + 10);
    size_t p = rd32(zip, eocd + 16);
    for (uint16_t i = 0; i < count; ++i) {
        if (rd32(zip, p) != 0x02014b50) throw std::runtime_error("bad central directory record");
        wr32(zip, p + 24, declared);
        const size_t name_len = rd16(zip, p + 28);
        const size_t extra_len = rd16(zip, p + 30);
        const size_t comment_len = rd16(zip, p + 32);
        p += 46 + name_len + extra_len + comment_len;
    }
    return zip;
}

// Archive with n entries whose declared total is ratio times the archive length.
inline std::string zip_with_ratio(size_t n, double ratio) {
    Entries entries;
    for (size_t i = 0; i < n; ++i) {
        entries.emplace_back("part" + std::to_string(i) + ".xml", "<x>" + std::to_string(i) + "</x>");
    }
    std::string zip = make_zip(entries);
    const uint32_t each = (uint32_t)((double)zip.size() * ratio / (double)n);
    return forge_declared_sizes(zip, each);
}

constexpr const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

inline std::string document_xml(const std::string& body) {
    return std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                       "<w:document xmlns:w=\"") + kWordNs +
           "\" xmlns:w14=\"http://schemas.microsoft.com/office/word/2010/wordml\"><w:body>" + body +
           "<w:sectPr/></w:body></w:document>";
}

inline std::string para(const std::string& text, const std::string& style = "") {
    std::string p = "<w:p>";
    if (!style.empty()) p += "<w:pPr><w:pStyle w:val=\"" + style + "\"/></w:pPr>";
    p += "<w:r><w:t xml:space=\"preserve\">" + text + "</w:t></w:r></w:p>";
    return p;
}

inline std::string make_docx(const std::string& body) {
    Entries parts = {
        {"[Content_Types].xml",
         "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
         "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
         "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
         "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
         "<Override PartName=\"/word/document.xml\" "
         "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
         "</Types>"},
        {"_rels/.rels",
         "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
         "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
         "<Relationship Id=\"rId1\" "
         "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
         "Target=\"word/document.xml\"/></Relationships>"},
        {"word/document.xml", document_xml(body)},
        {"word/_rels/document.xml.rels",
         "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
         "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\"/>"},
    };
    return make_zip(parts);
}

inline Entries read_all(const std::string& zip) {
    redline::ZipReader r(zip);
    redline::ReadBudget budget(1ull << 30);
    Entries out;
    for (const auto& e : r.entries()) {
        if (!e.is_directory) out.emplace_back(e.path, r.read(e, budget));
    }
    return out;
}

inline std::string entry(const std::string& zip, const std::string& path) {
    for (const auto& e : read_all(zip)) {
        if (e.first == path) return e.second;
    }
    return std::string();
}

inline bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

// -------------------- fakes --------------------

// Runs posted work only when asked to.
class ManualQueue : public redline::TaskQueue {
public:
    void post(std::function<void()> task) override { tasks.push_back(std::move(task)); }

    size_t run_all() {
        size_t n = 0;
        while (!tasks.empty()) {
            auto t = std::move(tasks.front());
            tasks.erase(tasks.begin());
            t();
            ++n;
        }
        return n;
    }

    std::vector<std::function<void()>> tasks;
};

struct Counters {
    std::atomic<int> doms_closed{0};
    std::atomic<int> editors_destroyed{0};
    std::atomic<int> created{0};
    std::atomic<int> exports{0};
    std::function<void()> on_destroy;
    redline::ExportOptions last_export;
};

class FakeDom : public redline::DomHandle {
public:
    explicit FakeDom(Counters& p) : counts_(p) {}
    void close() override {
        if (closed_) throw std::runtime_error("already closed");
        closed_ = true;
        ++counts_.doms_closed;
    }

private:
    Counters& counts_;
    bool closed_{false};
};

class FakeEditor : public redline::EditorHandle {
public:
    FakeEditor(Counters& p, std::string archive, bool fail_export)
        : counts_(p), archive_(std::move(archive)), fail_export_(fail_export) {}

    void destroy() override {
        if (counts_.on_destroy) counts_.on_destroy();
        ++counts_.editors_destroyed;
    }

    std::string export_archive(const redline::ExportOptions& opt) override {
        ++counts_.exports;
        counts_.last_export = opt;
        if (fail_export_) throw std::runtime_error("export exploded at /tmp/secret/path");
        return archive_;
    }

private:
    Counters& counts_;
    std::string archive_;
    bool fail_export_;
};

class FakeFactory : public redline::EditorFactory {
public:
    enum class Mode { Ok, ThrowAfterDom, ThrowBeforeAnything, NullEditor };

    explicit FakeFactory(Counters& p) : counts_(p) {}

    void create(const std::string& buffer, redline::EditorParts& out) override {
        ++counts_.created;
        if (before_create) before_create();
        if (mode == Mode::ThrowBeforeAnything) throw std::runtime_error("unparseable document");
        out.dom = std::make_shared<FakeDom>(counts_);
        if (mode == Mode::ThrowAfterDom) throw std::runtime_error("schema mismatch");
        if (mode == Mode::NullEditor) return;
        out.editor = std::make_unique<FakeEditor>(counts_, export_bytes.empty() ? buffer : export_bytes,
                                                  fail_export);
    }

    Mode mode{Mode::Ok};
    bool fail_export{false};
    std::string export_bytes;
    std::function<void()> before_create;

private:
    Counters& counts_;
};

class FakeExtractor : public redline::IrExtractor {
public:
    redline::DocumentIR extract(redline::EditorHandle&, const std::string& filename) override {
        redline::DocumentIR out = ir;
        out.filename = filename;
        return out;
    }
    redline::DocumentIR ir;
};

// Records every primitive call as "<op>:<block>".
class FakeMutator : public redline::BlockMutator {
public:
    redline::MutationResult replace(redline::EditorHandle&, const std::string& id, const std::string&,
                                    const redline::MutationOptions& opt) override {
        return record("replace", id, opt);
    }
    redline::MutationResult remove(redline::EditorHandle&, const std::string& id,
                                   const redline::MutationOptions& opt) override {
        return record("delete", id, opt);
    }
    redline::MutationResult insert_after(redline::EditorHandle&, const std::string& id, const std::string&,
                                         const redline::MutationOptions& opt) override {
        redline::MutationResult r = record("insert", id, opt);
        if (r.success) r.new_block_id = "new-" + std::to_string(++inserted);
        return r;
    }
    redline::MutationResult add_comment(redline::EditorHandle&, const std::string& id, const std::string&,
                                        const redline::Author&) override {
        if (fail_comments) {
            calls.push_back("comment:" + id);
            return redline::MutationResult::fail("comment store full");
        }
        redline::MutationResult r = record("comment", id, redline::MutationOptions{});
        if (r.success) r.comment_id = std::to_string(++comments);
        return r;
    }

    std::vector<std::string> calls;
    std::set<std::string> fail_ids;
    std::set<std::string> throw_ids;
    bool fail_comments{false};
    int inserted{0};
    int comments{0};
    redline::MutationOptions last_opt;

private:
    redline::MutationResult record(const char* op, const std::string& id, const redline::MutationOptions& opt) {
        calls.push_back(std::string(op) + ":" + id);
        last_opt = opt;
        if (throw_ids.count(id)) throw std::runtime_error("engine fault on " + id);
        if (fail_ids.count(id)) return redline::MutationResult::fail("primitive refused " + id);
        return redline::MutationResult::ok();
    }
};

inline redline::Block block(const std::string& id, const std::string& seq, const std::string& text,
                            const std::string& type = "paragraph", const std::string& style = "") {
    redline::Block b;
    b.id = id;
    b.seq_id = seq;
    b.text = text;
    b.type = type;
    b.style_id = style;
    return b;
}

inline redline::DocumentIR make_ir(std::vector<redline::Block> blocks) {
    redline::DocumentIR ir;
    ir.filename = "test.docx";
    for (size_t i = 0; i < blocks.size(); ++i) blocks[i].ordinal = i;
    ir.blocks = std::move(blocks);
    return ir;
}

} // namespace testutil
