// cpp/include/redline/ir.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace redline {

struct Block {
    std::string id;      // durable, UUID formatted
    std::string seq_id;  // short sequential id ("b001"); empty for blocks created during an edit
    std::string type;    // paragraph | heading | listItem | tableCell | toc
    int level{0};        // heading level, 0 otherwise
    std::string style_id;
    std::string text;
    size_t ordinal{0};   // position in document order
};

struct DocumentIR {
    std::string filename;
    std::vector<Block> blocks;

    // short id first, then durable id; nullptr if neither matches
    const Block* resolve(const std::string& ref) const;

    const Block* find_by_seq_id(const std::string& seq_id) const;
    const Block* find_by_id(const std::string& id) const;
};

nlohmann::json to_json(const Block& b);

// blocks, outline (headings), idMapping (seqId -> id), metadata
nlohmann::json to_json(const DocumentIR& ir);

} // namespace redline
