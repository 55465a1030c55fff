// cpp/include/redline/format_gate.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "redline/errors.h"
#include "redline/zip_io.h"

namespace redline {

constexpr double   kDefaultMaxRatio = 100.0;
constexpr uint64_t kDefaultMaxDecompressedBytes = 500ull * 1024 * 1024;

struct GateLimits {
    double max_ratio{kDefaultMaxRatio};
    uint64_t max_absolute_bytes{kDefaultMaxDecompressedBytes};
};

struct GateResult {
    bool ok{false};
    ErrorCode code{ErrorCode::Ok};
    std::string message;

    // filled by the ratio check
    double ratio{0.0};
    uint64_t total_uncompressed{0};
    size_t entry_count{0};
    uint64_t payload_bytes_read{0}; // always 0: the gate never inflates
};

// Local-file-header magic "PK\x03\x04".
GateResult validate_signature(std::string_view buffer);

// Central-directory-only expansion check. Never throws; a malformed archive
// yields CorruptArchive.
GateResult check_expansion_ratio(std::string_view buffer, const GateLimits& limits = {});

// Both stages, signature first.
GateResult check_upload(std::string_view buffer, const GateLimits& limits = {});

} // namespace redline
