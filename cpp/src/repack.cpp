// cpp/src/repack.cpp
#include "redline/repack.h"
#include "redline/errors.h"
#include "redline/zip_io.h"

#include <exception>

#include <spdlog/spdlog.h>

namespace redline {

std::string repack(std::string_view archive, const RepackOptions& opt) {
    try {
        ZipReader in(archive);
        ReadBudget budget(opt.max_inflated_bytes);
        ZipWriter out;

        for (const auto& e : in.entries()) {
            if (e.is_directory) continue;
            out.add(e.path, in.read(e, budget), opt.level);
        }
        std::string bytes = out.finish();

        spdlog::debug("repack: {} -> {} bytes, {} entries",
                      archive.size(), bytes.size(), in.entries().size());
        return bytes;
    } catch (const std::exception& e) {
        throw RedlineException(ErrorCode::RepackFailed, std::string("repack failed: ") + e.what());
    }
}

} // namespace redline
