// cpp/include/redline/edit.h
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace redline {

enum class EditKind {
    Replace,
    Delete,
    Insert,
    Comment,
    Unknown,
};

const char* edit_kind_name(EditKind k);
EditKind parse_edit_kind(const std::string& operation);

// One caller-supplied edit. block_id is the target for Replace/Delete/Comment
// and the anchor for Insert.
struct EditOperation {
    EditKind kind{EditKind::Unknown};
    std::string operation; // as sent, kept for error messages

    std::string block_id;
    std::string text;      // newText (Replace) or text (Insert)
    bool has_text{false};  // field present, even if empty
    std::string comment;   // optional; required for Comment

    // Insert only
    std::string insert_type{"paragraph"};
    int level{0};

    // Replace only: word-level diff instead of whole-paragraph replacement
    bool diff{true};
};

EditOperation edit_from_json(const nlohmann::json& j);

// throws std::invalid_argument if j is not an array
std::vector<EditOperation> parse_edits(const nlohmann::json& j);

} // namespace redline
