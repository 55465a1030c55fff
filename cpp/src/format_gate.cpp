// cpp/src/format_gate.cpp
#include "redline/format_gate.h"

#include <cstring>
#include <exception>
#include <limits>

namespace redline {

namespace {

constexpr char kZipMagic[4] = {'P', 'K', 0x03, 0x04};

GateResult reject(ErrorCode code, std::string msg) {
    GateResult r;
    r.ok = false;
    r.code = code;
    r.message = std::move(msg);
    return r;
}

uint64_t saturating_add(uint64_t a, uint64_t b) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    return (a > max - b) ? max : a + b;
}

} // namespace

GateResult validate_signature(std::string_view buffer) {
    if (buffer.size() < sizeof(kZipMagic)) {
        return reject(ErrorCode::InvalidFormat, "File too small to be a valid DOCX");
    }
    if (std::memcmp(buffer.data(), kZipMagic, sizeof(kZipMagic)) != 0) {
        return reject(ErrorCode::InvalidFormat, "Invalid file format: not a ZIP/DOCX file (bad magic bytes)");
    }
    GateResult r;
    r.ok = true;
    return r;
}

GateResult check_expansion_ratio(std::string_view buffer, const GateLimits& limits) {
    GateResult r;

    try {
        ZipReader reader(buffer);
        for (const auto& e : reader.entries()) {
            if (e.is_directory) continue;
            r.total_uncompressed = saturating_add(r.total_uncompressed, e.uncompressed_size);
            ++r.entry_count;
        }
        r.payload_bytes_read = reader.payload_bytes_read();
    } catch (const std::exception&) {
        return reject(ErrorCode::CorruptArchive, "Corrupted or invalid ZIP/DOCX file");
    }

    r.ratio = buffer.empty() ? 0.0 : (double)r.total_uncompressed / (double)buffer.size();

    if (r.total_uncompressed > limits.max_absolute_bytes) {
        r.code = ErrorCode::BombSuspected;
        r.message = "Decompressed size exceeds maximum allowed";
        return r;
    }
    if (r.ratio > limits.max_ratio) {
        r.code = ErrorCode::BombSuspected;
        r.message = "Suspicious compression ratio detected";
        return r;
    }

    r.ok = true;
    return r;
}

GateResult check_upload(std::string_view buffer, const GateLimits& limits) {
    GateResult sig = validate_signature(buffer);
    if (!sig.ok) return sig;
    return check_expansion_ratio(buffer, limits);
}

} // namespace redline
