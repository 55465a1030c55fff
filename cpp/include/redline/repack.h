// cpp/include/redline/repack.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "redline/format_gate.h"

namespace redline {

struct RepackOptions {
    int level{9};
    uint64_t max_inflated_bytes{kDefaultMaxDecompressedBytes};
};

// Re-encodes every entry at opt.level, keeping entry order and contents.
// throws RedlineException(RepackFailed); callers fall back to the input bytes.
std::string repack(std::string_view archive, const RepackOptions& opt = {});

} // namespace redline
