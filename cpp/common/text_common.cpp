// cpp/common/text_common.cpp
#include "text_common.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>

namespace {

struct Utf8Dec {
    uint32_t cp{0};
    size_t   len{1};
    bool     ok{false};
};

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

static inline Utf8Dec decode_utf8(std::string_view s, size_t i) {
    Utf8Dec r{};
    if (i >= s.size()) return r;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) {
        r.cp = c0; r.len = 1; r.ok = true;
        return r;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return r;

    if (i + len > s.size()) return r;
    for (size_t k = 1; k < len; ++k) {
        if (!is_cont((unsigned char)s[i + k])) return r;
    }

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (len == 3) {
        // overlong / surrogate
        if (c0 == 0xE0 && c1 < 0xA0) return r;
        if (c0 == 0xED && c1 >= 0xA0) return r;
    } else if (len == 4) {
        if (c0 == 0xF0 && c1 < 0x90) return r;
        if (c0 == 0xF4 && c1 > 0x8F) return r;
    }

    uint32_t cp = len == 2 ? (c0 & 0x1F) : len == 3 ? (c0 & 0x0F) : (c0 & 0x07);
    for (size_t k = 1; k < len; ++k) cp = (cp << 6) | ((unsigned char)s[i + k] & 0x3F);

    r.cp = cp; r.len = len; r.ok = true;
    return r;
}

static inline bool is_space_byte(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

void tokenize_words(std::string_view s, std::vector<TokenSpan>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        const size_t start = i;
        const bool space = is_space_byte((unsigned char)s[i]);
        while (i < n && is_space_byte((unsigned char)s[i]) == space) ++i;

        TokenSpan ts;
        ts.start = (uint32_t)start;
        ts.len = (uint32_t)(i - start);
        ts.space = space;
        out.push_back(ts);
    }
}

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

std::string trim_copy(std::string_view s) {
    size_t a = 0, b = s.size();
    while (a < b && is_space_byte((unsigned char)s[a])) ++a;
    while (b > a && is_space_byte((unsigned char)s[b - 1])) --b;
    return std::string(s.substr(a, b - a));
}

bool parse_bool_str(std::string_view s, bool& out) {
    const std::string v = to_lower_ascii(trim_copy(s));
    if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

uint64_t fnv1a64(std::string_view s, uint64_t seed) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string format_uuid(uint64_t hi, uint64_t lo) {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  (unsigned)(hi >> 32),
                  (unsigned)((hi >> 16) & 0xFFFF),
                  (unsigned)(hi & 0xFFFF),
                  (unsigned)(lo >> 48),
                  (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string gen_uuid_v4() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant
    return format_uuid(hi, lo);
}

std::string utc_now_iso8601() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

// base letter of U+00C0..U+00FF under canonical decomposition, 0 if none
static const char kLatin1Base[64] = {
    'A', 'A', 'A', 'A', 'A', 'A', 0,   'C', 'E', 'E', 'E', 'E', 'I', 'I', 'I', 'I',
    0,   'N', 'O', 'O', 'O', 'O', 'O', 0,   0,   'U', 'U', 'U', 'U', 'Y', 0,   0,
    'a', 'a', 'a', 'a', 'a', 'a', 0,   'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i',
    0,   'n', 'o', 'o', 'o', 'o', 'o', 0,   0,   'u', 'u', 'u', 'u', 'y', 0,   'y',
};

std::string ascii_fold(std::string_view s, char replacement) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        const unsigned char b = (unsigned char)s[i];
        if (b < 0x80) {
            out.push_back((char)b);
            ++i;
            continue;
        }
        Utf8Dec d = decode_utf8(s, i);
        if (d.ok && d.cp >= 0xC0 && d.cp <= 0xFF && kLatin1Base[d.cp - 0xC0] != '\0') {
            out.push_back(kLatin1Base[d.cp - 0xC0]);
        }
        out.push_back(replacement);
        i += d.ok ? d.len : 1;
    }
    return out;
}
