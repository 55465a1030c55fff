// cpp/src/wordml.cpp
#include "redline/wordml.h"
#include "redline/errors.h"
#include "redline/zip_io.h"

#include "text_common.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <map>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace redline {

namespace {

constexpr const char* kCommentsRelType =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
constexpr const char* kCommentsContentType =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml";
constexpr const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kRelsNs = "http://schemas.openxmlformats.org/package/2006/relationships";

constexpr unsigned kParseOptions =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single;

bool is_name(pugi::xml_node n, const char* name) {
    return std::strcmp(n.name(), name) == 0;
}

std::string save_xml(const pugi::xml_document& doc) {
    std::ostringstream os;
    doc.save(os, "", pugi::format_raw, pugi::encoding_utf8);
    return os.str();
}

bool load_xml(pugi::xml_document& doc, const std::string& bytes) {
    return static_cast<bool>(doc.load_buffer(bytes.data(), bytes.size(), kParseOptions, pugi::encoding_utf8));
}

WordmlEditor& as_wordml(EditorHandle& editor) {
    auto* w = dynamic_cast<WordmlEditor*>(&editor);
    if (!w) throw RedlineException(ErrorCode::Internal, "editor is not a WordprocessingML editor");
    return *w;
}

// -------------------- runs and text --------------------

template <class Fn>
void for_each_visible_run(pugi::xml_node n, Fn& fn) {
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (is_name(c, "w:r")) {
            fn(c);
            continue;
        }
        if (is_name(c, "w:pPr") || is_name(c, "w:del") || is_name(c, "w:moveFrom")) continue;
        for_each_visible_run(c, fn);
    }
}

void append_content_text(pugi::xml_node c, std::string& out) {
    if (is_name(c, "w:t")) out += c.text().get();
    else if (is_name(c, "w:tab")) out += '\t';
    else if (is_name(c, "w:br") || is_name(c, "w:cr")) out += '\n';
    else if (is_name(c, "w:noBreakHyphen")) out += '-';
}

size_t content_length(pugi::xml_node c) {
    std::string s;
    append_content_text(c, s);
    return s.size();
}

struct Atom {
    pugi::xml_node run;
    size_t start{0};
    size_t end{0};
};

std::vector<pugi::xml_node> visible_runs(pugi::xml_node p) {
    std::vector<pugi::xml_node> runs;
    auto collect = [&](pugi::xml_node r) { runs.push_back(r); };
    for_each_visible_run(p, collect);
    return runs;
}

std::vector<Atom> collect_atoms(pugi::xml_node p) {
    std::vector<Atom> atoms;
    size_t pos = 0;
    for (pugi::xml_node r : visible_runs(p)) {
        size_t len = 0;
        for (pugi::xml_node c = r.first_child(); c; c = c.next_sibling()) {
            if (c.type() == pugi::node_element) len += content_length(c);
        }
        atoms.push_back(Atom{r, pos, pos + len});
        pos += len;
    }
    return atoms;
}

// One content element per run, so every text boundary is a run boundary
// or lies inside a single w:t.
void explode_runs(pugi::xml_node p) {
    for (pugi::xml_node r : visible_runs(p)) {
        pugi::xml_node rpr = r.child("w:rPr");

        std::vector<pugi::xml_node> content;
        for (pugi::xml_node c = r.first_child(); c; c = c.next_sibling()) {
            if (c.type() == pugi::node_element && !is_name(c, "w:rPr")) content.push_back(c);
        }

        pugi::xml_node prev = r;
        for (size_t i = 1; i < content.size(); ++i) {
            pugi::xml_node nr = r.parent().insert_child_after("w:r", prev);
            if (rpr) nr.append_copy(rpr);
            nr.append_move(content[i]);
            prev = nr;
        }
    }
}

void set_preserve(pugi::xml_node t) {
    if (!t.attribute("xml:space")) t.append_attribute("xml:space") = "preserve";
}

void split_at(pugi::xml_node p, size_t offset) {
    for (const Atom& a : collect_atoms(p)) {
        if (!(a.start < offset && offset < a.end)) continue;

        pugi::xml_node t = a.run.child("w:t");
        if (!t) return;
        const std::string s = t.text().get();
        const size_t k = offset - a.start;

        pugi::xml_node tail = a.run.parent().insert_copy_after(a.run, a.run);
        t.text().set(s.substr(0, k).c_str());
        set_preserve(t);
        pugi::xml_node tt = tail.child("w:t");
        tt.text().set(s.substr(k).c_str());
        set_preserve(tt);
        return;
    }
}

void unwrap(pugi::xml_node n) {
    pugi::xml_node parent = n.parent();
    while (pugi::xml_node c = n.first_child()) parent.insert_move_before(c, n);
    parent.remove_child(n);
}

void set_revision_attrs(pugi::xml_node n, int id, const Author& author, const std::string& date) {
    n.append_attribute("w:id") = id;
    n.append_attribute("w:author") = author.name.empty() ? "redline" : author.name.c_str();
    n.append_attribute("w:date") = date.c_str();
}

// Moves first and every later sibling into a new w:ins placed right after
// the current one. The copy keeps author and date under a fresh id.
pugi::xml_node split_insertion(WordmlEditor& w, pugi::xml_node ins, pugi::xml_node first) {
    pugi::xml_node tail = ins.parent().insert_child_after("w:ins", ins);
    tail.append_attribute("w:id") = w.next_change_id();
    for (pugi::xml_attribute a : ins.attributes()) {
        if (std::strcmp(a.name(), "w:id") != 0) tail.append_attribute(a.name()) = a.value();
    }
    while (first) {
        pugi::xml_node next = first.next_sibling();
        tail.append_move(first);
        first = next;
    }
    return tail;
}

// Node next to which new content can be placed without nesting it inside an
// existing w:ins. An enclosing insertion is split at the run when needed.
pugi::xml_node anchor_after(WordmlEditor& w, pugi::xml_node run) {
    pugi::xml_node parent = run.parent();
    if (!is_name(parent, "w:ins")) return run;
    if (run.next_sibling()) split_insertion(w, parent, run.next_sibling());
    return parent;
}

pugi::xml_node anchor_before(WordmlEditor& w, pugi::xml_node run) {
    pugi::xml_node parent = run.parent();
    if (!is_name(parent, "w:ins")) return run;
    if (run.previous_sibling()) return split_insertion(w, parent, run);
    return parent;
}

void append_text_run(pugi::xml_node parent, pugi::xml_node rpr_proto, const std::string& text) {
    pugi::xml_node r = parent.append_child("w:r");
    if (rpr_proto) r.append_copy(rpr_proto);

    std::string buf;
    auto flush = [&] {
        if (buf.empty()) return;
        pugi::xml_node t = r.append_child("w:t");
        set_preserve(t);
        t.text().set(buf.c_str());
        buf.clear();
    };
    for (char ch : text) {
        if (ch == '\t') {
            flush();
            r.append_child("w:tab");
        } else if (ch == '\n') {
            flush();
            r.append_child("w:br");
        } else if (ch != '\r') {
            buf += ch;
        }
    }
    flush();
}

struct Revision {
    bool track{true};
    Author author;
    std::string date;
};

void insert_text_at(WordmlEditor& w, pugi::xml_node p, const std::vector<Atom>& atoms,
                    size_t offset, const std::string& text, const Revision& rev) {
    const Atom* before = nullptr;
    for (const Atom& a : atoms) {
        if (a.start < offset) before = &a;
    }

    pugi::xml_node rpr;
    if (before) rpr = before->run.child("w:rPr");
    else if (!atoms.empty()) rpr = atoms.front().run.child("w:rPr");

    const char* name = rev.track ? "w:ins" : "w:tmp";
    pugi::xml_node holder;
    if (before) {
        pugi::xml_node anchor = anchor_after(w, before->run);
        holder = anchor.parent().insert_child_after(name, anchor);
    } else if (!atoms.empty()) {
        pugi::xml_node anchor = anchor_before(w, atoms.front().run);
        holder = anchor.parent().insert_child_before(name, anchor);
    } else {
        holder = p.append_child(name);
    }

    append_text_run(holder, rpr, text);
    if (rev.track) set_revision_attrs(holder, w.next_change_id(), rev.author, rev.date);
    else unwrap(holder);
}

void delete_run(WordmlEditor& w, pugi::xml_node run, const Revision& rev) {
    if (!rev.track) {
        run.parent().remove_child(run);
        return;
    }
    pugi::xml_node del = run.parent().insert_child_before("w:del", run);
    set_revision_attrs(del, w.next_change_id(), rev.author, rev.date);
    del.append_move(run);

    for (pugi::xml_node c = run.first_child(); c; c = c.next_sibling()) {
        if (is_name(c, "w:t")) c.set_name("w:delText");
        else if (is_name(c, "w:instrText")) c.set_name("w:delInstrText");
    }
}

pugi::xml_node ensure_child_first(pugi::xml_node parent, const char* name) {
    pugi::xml_node c = parent.child(name);
    if (!c) c = parent.prepend_child(name);
    return c;
}

// Paragraph-mark revision: pPr/rPr/{w:ins|w:del}
void mark_paragraph(WordmlEditor& w, pugi::xml_node p, const char* kind, const Revision& rev) {
    pugi::xml_node ppr = ensure_child_first(p, "w:pPr");
    pugi::xml_node rpr = ppr.child("w:rPr");
    if (!rpr) rpr = ppr.append_child("w:rPr");
    set_revision_attrs(rpr.append_child(kind), w.next_change_id(), rev.author, rev.date);
}

// -------------------- block indexing --------------------

struct FieldStack {
    std::vector<bool> toc;
    bool active() const { return std::find(toc.begin(), toc.end(), true) != toc.end(); }
};

bool starts_with_toc(const std::string& instr) {
    const std::string s = trim_copy(instr);
    return s.size() >= 3 && s.compare(0, 3, "TOC") == 0;
}

// Advances the complex-field state through one paragraph. True if a TOC
// field is open at any point inside it.
bool scan_fields(pugi::xml_node n, FieldStack& fs) {
    bool seen = fs.active();
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (is_name(c, "w:del") || is_name(c, "w:pPr")) continue;

        if (is_name(c, "w:fldChar")) {
            const std::string type = c.attribute("w:fldCharType").value();
            if (type == "begin") fs.toc.push_back(false);
            else if (type == "end" && !fs.toc.empty()) fs.toc.pop_back();
        } else if (is_name(c, "w:instrText")) {
            if (!fs.toc.empty() && starts_with_toc(c.text().get())) fs.toc.back() = true;
        } else if (is_name(c, "w:fldSimple")) {
            if (starts_with_toc(c.attribute("w:instr").value())) seen = true;
        }
        if (fs.active()) seen = true;
        if (scan_fields(c, fs)) seen = true;
    }
    return seen;
}

bool is_toc_sdt(pugi::xml_node sdt) {
    pugi::xml_node gallery = sdt.child("w:sdtPr").child("w:docPartObj").child("w:docPartGallery");
    return gallery && std::strcmp(gallery.attribute("w:val").value(), "Table of Contents") == 0;
}

struct FoundParagraph {
    pugi::xml_node p;
    bool toc{false};
    bool in_table{false};
};

void walk_body(pugi::xml_node n, bool in_toc_sdt, bool in_table, FieldStack& fs,
               std::vector<FoundParagraph>& out) {
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (is_name(c, "w:p")) {
            const bool toc_field = scan_fields(c, fs);
            out.push_back(FoundParagraph{c, in_toc_sdt || toc_field, in_table});
        } else if (is_name(c, "w:sdt")) {
            walk_body(c, in_toc_sdt || is_toc_sdt(c), in_table, fs, out);
        } else if (is_name(c, "w:tc")) {
            walk_body(c, in_toc_sdt, true, fs, out);
        } else if (!is_name(c, "w:sectPr") && !is_name(c, "w:sdtPr")) {
            walk_body(c, in_toc_sdt, in_table, fs, out);
        }
    }
}

int heading_level(const std::string& style_lower, pugi::xml_node ppr) {
    if (style_lower == "title") return 1;
    if (style_lower.compare(0, 7, "heading") == 0) {
        std::string rest = trim_copy(style_lower.substr(7));
        const bool digits = std::all_of(rest.begin(), rest.end(),
                                        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        if (!rest.empty() && digits) {
            const int lvl = std::atoi(rest.c_str());
            if (lvl >= 1 && lvl <= 9) return lvl;
        }
    }
    pugi::xml_attribute outline = ppr.child("w:outlineLvl").attribute("w:val");
    if (outline) {
        const int lvl = outline.as_int(9);
        if (lvl >= 0 && lvl < 9) return lvl + 1;
    }
    return 0;
}

Block describe(const FoundParagraph& f, size_t ordinal) {
    Block b;
    pugi::xml_node ppr = f.p.child("w:pPr");
    b.style_id = ppr.child("w:pStyle").attribute("w:val").value();
    b.text = paragraph_text(f.p);
    b.ordinal = ordinal;

    char seq[32];
    std::snprintf(seq, sizeof(seq), "b%03zu", ordinal + 1);
    b.seq_id = seq;

    std::string key = f.p.attribute("w14:paraId").value();
    key += '\x1f';
    key += std::to_string(ordinal);
    key += '\x1f';
    key += b.text;
    b.id = format_uuid(fnv1a64(key), fnv1a64(key, 0x84222325cbf29ce4ULL));

    const std::string style = to_lower_ascii(b.style_id);
    const int level = heading_level(style, ppr);
    if (f.toc || style.compare(0, 3, "toc") == 0) {
        b.type = "toc";
    } else if (level > 0) {
        b.type = "heading";
        b.level = level;
    } else if (ppr.child("w:numPr") || style == "listparagraph") {
        b.type = "listItem";
    } else if (f.in_table) {
        b.type = "tableCell";
    } else {
        b.type = "paragraph";
    }
    return b;
}

void max_id(pugi::xml_node n, int& best) {
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (pugi::xml_attribute a = c.attribute("w:id")) best = std::max(best, a.as_int(0));
        max_id(c, best);
    }
}

// -------------------- export --------------------

void collect_named(pugi::xml_node n, const char* name, std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (is_name(c, name)) {
            out.push_back(c);
            continue;
        }
        collect_named(c, name, out);
    }
}

// Resolves every tracked revision to its accepted state.
void accept_all_changes(pugi::xml_document& doc) {
    std::vector<pugi::xml_node> dels;
    collect_named(doc, "w:del", dels);
    collect_named(doc, "w:moveFrom", dels);

    std::vector<pugi::xml_node> dropped_marks;
    for (pugi::xml_node d : dels) {
        if (is_name(d.parent(), "w:rPr")) {
            dropped_marks.push_back(d.parent().parent().parent());
            d.parent().remove_child(d);
        } else {
            d.parent().remove_child(d);
        }
    }

    std::vector<pugi::xml_node> inss;
    collect_named(doc, "w:ins", inss);
    collect_named(doc, "w:moveTo", inss);
    for (pugi::xml_node i : inss) {
        if (is_name(i.parent(), "w:rPr")) i.parent().remove_child(i);
        else unwrap(i);
    }

    for (pugi::xml_node p : dropped_marks) {
        if (is_name(p, "w:p") && visible_runs(p).empty()) p.parent().remove_child(p);
    }
}

std::string initials_of(const std::string& name) {
    std::string out;
    bool at_word = true;
    for (char c : name) {
        if (c == ' ') {
            at_word = true;
        } else if (at_word) {
            out += c;
            at_word = false;
        }
    }
    return out;
}

std::string build_comments_part(const std::string* existing, const std::vector<CommentRecord>& comments,
                                const std::string& date) {
    pugi::xml_document doc;
    if (!existing || !load_xml(doc, *existing) || !doc.child("w:comments")) {
        doc.reset();
        pugi::xml_node decl = doc.append_child(pugi::node_declaration);
        decl.append_attribute("version") = "1.0";
        decl.append_attribute("encoding") = "UTF-8";
        decl.append_attribute("standalone") = "yes";
        doc.append_child("w:comments").append_attribute("xmlns:w") = kWordNs;
    }

    pugi::xml_node root = doc.child("w:comments");
    for (const auto& c : comments) {
        pugi::xml_node node = root.append_child("w:comment");
        node.append_attribute("w:id") = c.id.c_str();
        node.append_attribute("w:author") = c.author.name.c_str();
        node.append_attribute("w:date") = date.c_str();
        node.append_attribute("w:initials") = initials_of(c.author.name).c_str();
        append_text_run(node.append_child("w:p"), pugi::xml_node(), c.text);
    }
    return save_xml(doc);
}

std::string build_rels_part(const std::string* existing) {
    pugi::xml_document doc;
    if (!existing || !load_xml(doc, *existing) || !doc.child("Relationships")) {
        doc.reset();
        pugi::xml_node decl = doc.append_child(pugi::node_declaration);
        decl.append_attribute("version") = "1.0";
        decl.append_attribute("encoding") = "UTF-8";
        decl.append_attribute("standalone") = "yes";
        doc.append_child("Relationships").append_attribute("xmlns") = kRelsNs;
    }

    pugi::xml_node root = doc.child("Relationships");
    int next = 1;
    for (pugi::xml_node r : root.children("Relationship")) {
        if (std::strcmp(r.attribute("Type").value(), kCommentsRelType) == 0) return save_xml(doc);
        const std::string id = r.attribute("Id").value();
        if (id.compare(0, 3, "rId") == 0) next = std::max(next, std::atoi(id.c_str() + 3) + 1);
    }

    const std::string id = "rId" + std::to_string(next);
    pugi::xml_node rel = root.append_child("Relationship");
    rel.append_attribute("Id") = id.c_str();
    rel.append_attribute("Type") = kCommentsRelType;
    rel.append_attribute("Target") = "comments.xml";
    return save_xml(doc);
}

// empty string if the content types part is absent or unreadable
std::string build_content_types_part(const std::string* existing) {
    pugi::xml_document doc;
    if (!existing || !load_xml(doc, *existing) || !doc.child("Types")) return std::string();

    pugi::xml_node root = doc.child("Types");
    for (pugi::xml_node o : root.children("Override")) {
        if (std::strcmp(o.attribute("PartName").value(), "/word/comments.xml") == 0) return save_xml(doc);
    }
    pugi::xml_node o = root.append_child("Override");
    o.append_attribute("PartName") = "/word/comments.xml";
    o.append_attribute("ContentType") = kCommentsContentType;
    return save_xml(doc);
}

std::string stamp_core_properties(const std::string& existing, const Author& author) {
    pugi::xml_document doc;
    if (!load_xml(doc, existing)) return existing;
    pugi::xml_node root = doc.first_child();
    while (root && root.type() != pugi::node_element) root = root.next_sibling();
    if (!root) return existing;

    pugi::xml_node who = root.child("cp:lastModifiedBy");
    if (!who) who = root.append_child("cp:lastModifiedBy");
    who.text().set(author.name.c_str());
    return save_xml(doc);
}

} // namespace

// -------------------- free functions --------------------

std::string paragraph_text(pugi::xml_node p) {
    std::string out;
    auto add = [&](pugi::xml_node r) {
        for (pugi::xml_node c = r.first_child(); c; c = c.next_sibling()) {
            if (c.type() == pugi::node_element) append_content_text(c, out);
        }
    };
    for_each_visible_run(p, add);
    return out;
}

std::vector<DiffHunk> word_diff(const std::string& before, const std::string& after, size_t max_cells) {
    std::vector<TokenSpan> a, b;
    tokenize_words(before, a);
    tokenize_words(after, b);

    const size_t n = a.size();
    const size_t m = b.size();
    if (n == 0 && m == 0) return {};
    if ((n + 1) * (m + 1) > max_cells) {
        return {DiffHunk{0, before.size(), after}};
    }

    auto tok = [](const std::string& s, const TokenSpan& t) {
        return std::string_view(s).substr(t.start, t.len);
    };

    // suffix LCS lengths
    std::vector<uint32_t> dp((n + 1) * (m + 1), 0);
    auto at = [&](size_t i, size_t j) -> uint32_t& { return dp[i * (m + 1) + j]; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if (tok(before, a[i]) == tok(after, b[j])) at(i, j) = at(i + 1, j + 1) + 1;
            else at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
        }
    }

    std::vector<DiffHunk> hunks;
    DiffHunk cur;
    bool open = false;
    auto flush = [&] {
        if (open && (cur.old_len > 0 || !cur.inserted.empty())) hunks.push_back(cur);
        cur = DiffHunk{};
        open = false;
    };
    auto start_hunk = [&](size_t i) {
        if (open) return;
        cur.old_pos = i < n ? a[i].start : before.size();
        open = true;
    };

    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && tok(before, a[i]) == tok(after, b[j])) {
            flush();
            ++i;
            ++j;
        } else if (j < m && (i == n || at(i, j + 1) >= at(i + 1, j))) {
            start_hunk(i);
            cur.inserted += tok(after, b[j]);
            ++j;
        } else {
            start_hunk(i);
            cur.old_len += a[i].len;
            ++i;
        }
    }
    flush();
    return hunks;
}

// -------------------- WordmlDom --------------------

void WordmlDom::close() {
    if (closed_) throw RedlineException(ErrorCode::Internal, "document already closed");
    closed_ = true;
    document.reset();
    parts.clear();
    parts.shrink_to_fit();
}

const std::string* WordmlDom::part(const std::string& path) const {
    for (const auto& p : parts) {
        if (p.first == path) return &p.second;
    }
    return nullptr;
}

// -------------------- WordmlEditor --------------------

WordmlEditor::WordmlEditor(std::shared_ptr<WordmlDom> dom) : dom_(std::move(dom)) {
    int best = 0;
    max_id(dom_->document, best);
    if (const std::string* comments = dom_->part(kCommentsPart)) {
        pugi::xml_document cdoc;
        if (load_xml(cdoc, *comments)) max_id(cdoc, best);
    }
    next_id_ = best + 1;
}

void WordmlEditor::destroy() {
    nodes_.clear();
    blocks_.clear();
    deleted_.clear();
    dom_.reset();
}

WordmlDom& WordmlEditor::dom() {
    if (!dom_ || dom_->closed()) throw RedlineException(ErrorCode::Internal, "editor destroyed");
    return *dom_;
}

void WordmlEditor::ensure_indexed() {
    if (indexed_) return;
    pugi::xml_node body = dom().document.child("w:document").child("w:body");

    std::vector<FoundParagraph> found;
    FieldStack fs;
    walk_body(body, false, false, fs, found);

    blocks_.clear();
    blocks_.reserve(found.size());
    for (size_t i = 0; i < found.size(); ++i) {
        Block b = describe(found[i], i);
        nodes_[b.id] = found[i].p;
        blocks_.push_back(std::move(b));
    }
    indexed_ = true;
}

const std::vector<Block>& WordmlEditor::blocks() {
    ensure_indexed();
    return blocks_;
}

pugi::xml_node WordmlEditor::node(const std::string& block_id) {
    ensure_indexed();
    auto it = nodes_.find(block_id);
    return it == nodes_.end() ? pugi::xml_node() : it->second;
}

void WordmlEditor::bind(const std::string& block_id, pugi::xml_node p) {
    ensure_indexed();
    nodes_[block_id] = p;
}

std::string WordmlEditor::export_archive(const ExportOptions& opt) {
    WordmlDom& d = dom();

    pugi::xml_document doc;
    doc.reset(d.document);
    if (opt.final_doc) accept_all_changes(doc);

    std::map<std::string, std::string> replaced;
    replaced[kDocumentPart] = save_xml(doc);

    bool new_comments_part = false;
    if (!opt.comments.empty()) {
        const std::string* existing = d.part(kCommentsPart);
        new_comments_part = existing == nullptr;
        replaced[kCommentsPart] = build_comments_part(existing, opt.comments, utc_now_iso8601());
        replaced[kDocumentRelsPart] = build_rels_part(d.part(kDocumentRelsPart));

        std::string types = build_content_types_part(d.part(kContentTypesPart));
        if (!types.empty()) replaced[kContentTypesPart] = std::move(types);
    }

    if (!opt.author.name.empty()) {
        if (const std::string* core = d.part("docProps/core.xml")) {
            replaced["docProps/core.xml"] = stamp_core_properties(*core, opt.author);
        }
    }

    ZipWriter out;
    bool rels_written = false;
    for (const auto& part : d.parts) {
        auto it = replaced.find(part.first);
        if (it != replaced.end()) {
            if (part.first == kDocumentRelsPart) rels_written = true;
            out.add(part.first, it->second, 0);
        } else {
            out.add(part.first, part.second, 0);
        }
    }
    if (new_comments_part) out.add(kCommentsPart, replaced[kCommentsPart], 0);
    if (!rels_written && replaced.count(kDocumentRelsPart)) {
        out.add(kDocumentRelsPart, replaced[kDocumentRelsPart], 0);
    }
    return out.finish();
}

// -------------------- factory / extractor --------------------

void WordmlEditorFactory::create(const std::string& buffer, EditorParts& out) {
    auto dom = std::make_shared<WordmlDom>();
    out.dom = dom;

    ZipReader reader(buffer);
    ReadBudget budget(max_inflated_bytes_);
    for (const auto& e : reader.entries()) {
        if (e.is_directory) continue;
        dom->parts.emplace_back(e.path, reader.read(e, budget));
    }

    const std::string* main = dom->part(kDocumentPart);
    if (!main) {
        throw RedlineException(ErrorCode::SessionFailed, "package has no word/document.xml");
    }

    pugi::xml_parse_result res =
        dom->document.load_buffer(main->data(), main->size(), kParseOptions, pugi::encoding_utf8);
    if (!res) {
        throw RedlineException(ErrorCode::SessionFailed,
                               std::string("word/document.xml: ") + res.description());
    }
    if (!dom->document.child("w:document").child("w:body")) {
        throw RedlineException(ErrorCode::SessionFailed, "word/document.xml has no body");
    }

    out.editor = std::make_unique<WordmlEditor>(dom);
    spdlog::debug("wordml: loaded {} parts, {} bytes inflated", dom->parts.size(), budget.used());
}

DocumentIR WordmlIrExtractor::extract(EditorHandle& editor, const std::string& filename) {
    WordmlEditor& w = as_wordml(editor);
    DocumentIR ir;
    ir.filename = filename;
    ir.blocks = w.blocks();
    return ir;
}

// -------------------- mutator --------------------

MutationResult WordmlBlockMutator::replace(EditorHandle& editor, const std::string& block_id,
                                           const std::string& new_text, const MutationOptions& opt) {
    WordmlEditor& w = as_wordml(editor);
    pugi::xml_node p = w.node(block_id);
    if (!p) return MutationResult::fail("Block not found: " + block_id);
    if (w.is_deleted(block_id)) return MutationResult::fail("Block has been deleted: " + block_id);

    const std::string old_text = paragraph_text(p);
    if (old_text == new_text) return MutationResult::ok();

    std::vector<DiffHunk> hunks;
    if (opt.diff) hunks = word_diff(old_text, new_text);
    else hunks.push_back(DiffHunk{0, old_text.size(), new_text});

    explode_runs(p);
    for (const auto& h : hunks) {
        split_at(p, h.old_pos);
        split_at(p, h.old_pos + h.old_len);
    }
    const std::vector<Atom> atoms = collect_atoms(p);

    Revision rev{opt.track_changes, opt.author, utc_now_iso8601()};

    // insertions anchor on runs that deletion may remove
    for (const auto& h : hunks) {
        if (!h.inserted.empty()) insert_text_at(w, p, atoms, h.old_pos + h.old_len, h.inserted, rev);
    }
    for (const auto& h : hunks) {
        if (h.old_len == 0) continue;
        for (const Atom& a : atoms) {
            if (a.end > a.start && a.start >= h.old_pos && a.end <= h.old_pos + h.old_len) {
                delete_run(w, a.run, rev);
            }
        }
    }
    return MutationResult::ok();
}

MutationResult WordmlBlockMutator::remove(EditorHandle& editor, const std::string& block_id,
                                          const MutationOptions& opt) {
    WordmlEditor& w = as_wordml(editor);
    pugi::xml_node p = w.node(block_id);
    if (!p) return MutationResult::fail("Block not found: " + block_id);
    if (w.is_deleted(block_id)) return MutationResult::fail("Block has been deleted: " + block_id);

    Revision rev{opt.track_changes, opt.author, utc_now_iso8601()};
    if (!rev.track) {
        p.parent().remove_child(p);
        w.bind(block_id, pugi::xml_node());
        w.mark_deleted(block_id);
        return MutationResult::ok();
    }

    for (const Atom& a : collect_atoms(p)) delete_run(w, a.run, rev);
    mark_paragraph(w, p, "w:del", rev);
    w.mark_deleted(block_id);
    return MutationResult::ok();
}

MutationResult WordmlBlockMutator::insert_after(EditorHandle& editor, const std::string& anchor_block_id,
                                                const std::string& text, const MutationOptions& opt) {
    WordmlEditor& w = as_wordml(editor);
    pugi::xml_node anchor = w.node(anchor_block_id);
    if (!anchor) return MutationResult::fail("Block not found: " + anchor_block_id);

    Revision rev{opt.track_changes, opt.author, utc_now_iso8601()};
    pugi::xml_node np = anchor.parent().insert_child_after("w:p", anchor);

    std::string style;
    if (opt.block_type == "heading") style = "Heading" + std::to_string(opt.level > 0 ? std::min(opt.level, 9) : 1);
    else if (opt.block_type == "listItem") style = "ListParagraph";
    if (!style.empty()) {
        ensure_child_first(np, "w:pPr").append_child("w:pStyle").append_attribute("w:val") = style.c_str();
    }

    if (rev.track) {
        mark_paragraph(w, np, "w:ins", rev);
        pugi::xml_node ins = np.append_child("w:ins");
        set_revision_attrs(ins, w.next_change_id(), rev.author, rev.date);
        append_text_run(ins, pugi::xml_node(), text);
    } else {
        append_text_run(np, pugi::xml_node(), text);
    }

    MutationResult r = MutationResult::ok();
    r.new_block_id = gen_uuid_v4();
    w.bind(r.new_block_id, np);
    return r;
}

MutationResult WordmlBlockMutator::add_comment(EditorHandle& editor, const std::string& block_id,
                                               const std::string& text, const Author& author) {
    WordmlEditor& w = as_wordml(editor);
    pugi::xml_node p = w.node(block_id);
    if (!p) return MutationResult::fail("Block not found: " + block_id);
    if (text.empty()) return MutationResult::fail("Comment text is empty");
    const std::string id = std::to_string(w.next_change_id());
    spdlog::debug("wordml: comment {} on {} by {}", id, block_id, author.name);

    pugi::xml_node ppr = p.child("w:pPr");
    pugi::xml_node start = ppr ? p.insert_child_after("w:commentRangeStart", ppr)
                               : p.prepend_child("w:commentRangeStart");
    start.append_attribute("w:id") = id.c_str();
    p.append_child("w:commentRangeEnd").append_attribute("w:id") = id.c_str();

    pugi::xml_node ref = p.append_child("w:r");
    ref.append_child("w:rPr").append_child("w:rStyle").append_attribute("w:val") = "CommentReference";
    ref.append_child("w:commentReference").append_attribute("w:id") = id.c_str();

    MutationResult r = MutationResult::ok();
    r.comment_id = id;
    return r;
}

} // namespace redline
