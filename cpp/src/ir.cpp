// cpp/src/ir.cpp
#include "redline/ir.h"

namespace redline {

const Block* DocumentIR::find_by_seq_id(const std::string& seq_id) const {
    if (seq_id.empty()) return nullptr;
    for (const auto& b : blocks) {
        if (b.seq_id == seq_id) return &b;
    }
    return nullptr;
}

const Block* DocumentIR::find_by_id(const std::string& id) const {
    if (id.empty()) return nullptr;
    for (const auto& b : blocks) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

const Block* DocumentIR::resolve(const std::string& ref) const {
    if (const Block* b = find_by_seq_id(ref)) return b;
    return find_by_id(ref);
}

nlohmann::json to_json(const Block& b) {
    nlohmann::json j;
    j["id"] = b.id;
    j["seqId"] = b.seq_id;
    j["type"] = b.type;
    if (b.level > 0) j["level"] = b.level;
    if (!b.style_id.empty()) j["styleId"] = b.style_id;
    j["text"] = b.text;
    j["ordinal"] = b.ordinal;
    return j;
}

nlohmann::json to_json(const DocumentIR& ir) {
    nlohmann::json j;

    nlohmann::json blocks = nlohmann::json::array();
    nlohmann::json outline = nlohmann::json::array();
    nlohmann::json id_mapping = nlohmann::json::object();
    size_t headings = 0;

    for (const auto& b : ir.blocks) {
        blocks.push_back(to_json(b));
        if (!b.seq_id.empty()) id_mapping[b.seq_id] = b.id;
        if (b.type == "heading") {
            outline.push_back({
                {"id", b.id},
                {"seqId", b.seq_id},
                {"level", b.level},
                {"text", b.text},
            });
            ++headings;
        }
    }

    j["metadata"] = {
        {"filename", ir.filename},
        {"format", "full"},
        {"blockCount", ir.blocks.size()},
        {"headingCount", headings},
    };
    j["blocks"] = std::move(blocks);
    j["outline"] = std::move(outline);
    j["idMapping"] = std::move(id_mapping);
    return j;
}

} // namespace redline
