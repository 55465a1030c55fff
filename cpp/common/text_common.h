// cpp/common/text_common.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct TokenSpan {
    uint32_t start{0};
    uint32_t len{0};
    bool space{false}; // whitespace run
};

// Splits s into alternating word and whitespace spans covering every byte,
// so concatenating the spans gives s back.
void tokenize_words(std::string_view s, std::vector<TokenSpan>& out);

std::string to_lower_ascii(std::string_view s);
std::string trim_copy(std::string_view s);

// "true|1|yes|on" / "false|0|no|off", case-insensitive. false if unrecognized.
bool parse_bool_str(std::string_view s, bool& out);

// FNV-1a 64-bit, seedable
uint64_t fnv1a64(std::string_view s, uint64_t seed = 1469598103934665603ULL);

// 128-bit value formatted as 8-4-4-4-12 lowercase hex
std::string format_uuid(uint64_t hi, uint64_t lo);

// Random RFC 4122 version 4 UUID
std::string gen_uuid_v4();

// "2024-01-31T12:00:00Z"
std::string utc_now_iso8601();

// Each non-ASCII code point (or invalid byte) becomes one replacement char.
// Accented Latin-1 letters keep their base letter first: "\xC3\xA9" -> "e" + replacement.
std::string ascii_fold(std::string_view s, char replacement);
