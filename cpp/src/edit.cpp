// cpp/src/edit.cpp
#include "redline/edit.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace redline {

namespace {

bool get_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

const char* edit_kind_name(EditKind k) {
    switch (k) {
        case EditKind::Replace: return "replace";
        case EditKind::Delete:  return "delete";
        case EditKind::Insert:  return "insert";
        case EditKind::Comment: return "comment";
        case EditKind::Unknown: return "unknown";
    }
    return "unknown";
}

EditKind parse_edit_kind(const std::string& operation) {
    if (operation == "replace") return EditKind::Replace;
    if (operation == "delete")  return EditKind::Delete;
    if (operation == "insert")  return EditKind::Insert;
    if (operation == "comment") return EditKind::Comment;
    return EditKind::Unknown;
}

EditOperation edit_from_json(const nlohmann::json& j) {
    EditOperation e;
    if (!j.is_object()) return e;

    get_string(j, "operation", e.operation);
    e.kind = parse_edit_kind(e.operation);
    get_string(j, "comment", e.comment);

    switch (e.kind) {
        case EditKind::Replace:
            get_string(j, "blockId", e.block_id);
            e.has_text = get_string(j, "newText", e.text);
            if (auto it = j.find("diff"); it != j.end() && it->is_boolean()) e.diff = it->get<bool>();
            break;
        case EditKind::Insert:
            get_string(j, "afterBlockId", e.block_id);
            e.has_text = get_string(j, "text", e.text);
            get_string(j, "type", e.insert_type);
            if (auto it = j.find("level"); it != j.end() && it->is_number_integer()) {
                e.level = static_cast<int>(std::clamp<int64_t>(it->get<int64_t>(), 0, 9));
            }
            break;
        case EditKind::Delete:
        case EditKind::Comment:
        case EditKind::Unknown:
            get_string(j, "blockId", e.block_id);
            break;
    }
    return e;
}

std::vector<EditOperation> parse_edits(const nlohmann::json& j) {
    if (!j.is_array()) throw std::invalid_argument("Edits field must be a JSON array");

    std::vector<EditOperation> out;
    out.reserve(j.size());
    for (const auto& e : j) out.push_back(edit_from_json(e));
    return out;
}

} // namespace redline
