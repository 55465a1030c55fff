// cpp/src/zip_io.cpp
#include "redline/zip_io.h"
#include "redline/errors.h"

#include <zip.h>

#include <algorithm>
#include <cstdio>
#include <memory>

namespace redline {

namespace {

constexpr size_t kReadChunk = 1 << 16;

// DOS epoch, keeps repacked output deterministic
constexpr time_t kFixedMtime = 315532800;

std::string take_error(zip_error_t& error) {
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

} // namespace

// -------------------- ReadBudget --------------------

void ReadBudget::consume(uint64_t n) {
    used_ += n;
    if (used_ > max_bytes_) {
        throw RedlineException(ErrorCode::BombSuspected,
                               "decompressed bytes exceed limit of " + std::to_string(max_bytes_));
    }
}

// -------------------- ZipReader --------------------

ZipReader::ZipReader(std::string_view bytes) {
    zip_error_t error;
    zip_error_init(&error);

    zip_source_t* src = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    if (!src) {
        throw RedlineException(ErrorCode::CorruptArchive, "zip_source_buffer_create failed: " + take_error(error));
    }

    za_ = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!za_) {
        zip_source_free(src);
        throw RedlineException(ErrorCode::CorruptArchive, "zip_open failed: " + take_error(error));
    }
    zip_error_fini(&error);

    const zip_int64_t n = zip_get_num_entries(za_, 0);
    if (n < 0) {
        zip_discard(za_);
        za_ = nullptr;
        throw RedlineException(ErrorCode::CorruptArchive, "zip_get_num_entries failed");
    }

    entries_.reserve((size_t)n);
    for (zip_uint64_t i = 0; i < (zip_uint64_t)n; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za_, i, 0, &st) != 0) {
            const std::string msg = zip_strerror(za_);
            zip_discard(za_);
            za_ = nullptr;
            throw RedlineException(ErrorCode::CorruptArchive, "zip_stat_index failed: " + msg);
        }

        ArchiveEntry e;
        e.index = i;
        e.path = st.name ? st.name : "";
        if (st.valid & ZIP_STAT_SIZE) e.uncompressed_size = (uint64_t)st.size;
        if (st.valid & ZIP_STAT_COMP_SIZE) e.compressed_size = (uint64_t)st.comp_size;
        e.is_directory = !e.path.empty() && e.path.back() == '/';
        entries_.push_back(std::move(e));
    }
}

ZipReader::~ZipReader() {
    if (za_) zip_discard(za_);
}

std::string ZipReader::read(const ArchiveEntry& e, ReadBudget& budget) {
    zip_file_t* zf = zip_fopen_index(za_, e.index, 0);
    if (!zf) {
        throw RedlineException(ErrorCode::CorruptArchive,
                               "zip_fopen_index failed for " + e.path + ": " + zip_strerror(za_));
    }
    auto zf_guard = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>(zf, &zip_fclose);

    std::string out;
    out.reserve((size_t)std::min<uint64_t>(e.uncompressed_size, budget.max_bytes()));

    char buf[kReadChunk];
    while (true) {
        const zip_int64_t rd = zip_fread(zf, buf, sizeof(buf));
        if (rd < 0) {
            throw RedlineException(ErrorCode::CorruptArchive,
                                   "zip_fread failed for " + e.path + ": " + zip_file_strerror(zf));
        }
        if (rd == 0) break;

        payload_bytes_read_ += (uint64_t)rd;
        budget.consume((uint64_t)rd);
        if (out.size() + (size_t)rd > e.uncompressed_size) {
            throw RedlineException(ErrorCode::CorruptArchive, "entry larger than declared size: " + e.path);
        }
        out.append(buf, (size_t)rd);
    }
    return out;
}

// -------------------- ZipWriter --------------------

ZipWriter::ZipWriter() {
    zip_error_t error;
    zip_error_init(&error);

    src_ = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (!src_) {
        throw RedlineException(ErrorCode::Internal, "zip_source_buffer_create failed: " + take_error(error));
    }

    za_ = zip_open_from_source(src_, ZIP_TRUNCATE, &error);
    if (!za_) {
        zip_source_free(src_);
        src_ = nullptr;
        throw RedlineException(ErrorCode::Internal, "zip_open_from_source failed: " + take_error(error));
    }
    zip_error_fini(&error);

    // keep the buffer alive after zip_close so the result can be read back
    zip_source_keep(src_);
}

ZipWriter::~ZipWriter() {
    if (za_) zip_discard(za_);
    if (src_) zip_source_free(src_);
}

void ZipWriter::add(const std::string& path, std::string data, int level) {
    if (!za_) throw RedlineException(ErrorCode::Internal, "ZipWriter already finished");

    data_.push_back(std::move(data));
    const std::string& stored = data_.back();

    zip_source_t* s = zip_source_buffer(za_, stored.data(), stored.size(), 0);
    if (!s) {
        throw RedlineException(ErrorCode::Internal, "zip_source_buffer failed for " + path + ": " + zip_strerror(za_));
    }

    const zip_int64_t idx = zip_file_add(za_, path.c_str(), s, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (idx < 0) {
        zip_source_free(s);
        throw RedlineException(ErrorCode::Internal, "zip_file_add failed for " + path + ": " + zip_strerror(za_));
    }

    const zip_int32_t method = level <= 0 ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    const zip_uint32_t clamped = level <= 0 ? 0u : (zip_uint32_t)std::min(level, 9);
    if (zip_set_file_compression(za_, (zip_uint64_t)idx, method, clamped) != 0) {
        throw RedlineException(ErrorCode::Internal, "zip_set_file_compression failed for " + path);
    }
    zip_file_set_mtime(za_, (zip_uint64_t)idx, kFixedMtime, 0);
}

std::string ZipWriter::finish() {
    if (!za_) throw RedlineException(ErrorCode::Internal, "ZipWriter already finished");

    if (data_.empty()) {
        // libzip removes an empty archive on close; emit a bare end-of-central-directory record
        zip_discard(za_);
        za_ = nullptr;
        std::string eocd("PK\x05\x06", 4);
        eocd.append(18, '\0');
        return eocd;
    }

    if (zip_close(za_) != 0) {
        const std::string msg = zip_strerror(za_);
        zip_discard(za_);
        za_ = nullptr;
        throw RedlineException(ErrorCode::Internal, "zip_close failed: " + msg);
    }
    za_ = nullptr;

    if (zip_source_open(src_) != 0) {
        throw RedlineException(ErrorCode::Internal, "cannot reopen archive buffer");
    }
    zip_source_seek(src_, 0, SEEK_END);
    const zip_int64_t size = zip_source_tell(src_);
    zip_source_seek(src_, 0, SEEK_SET);
    if (size < 0) {
        zip_source_close(src_);
        throw RedlineException(ErrorCode::Internal, "cannot size archive buffer");
    }

    std::string out((size_t)size, '\0');
    const zip_int64_t rd = zip_source_read(src_, out.data(), (zip_uint64_t)size);
    zip_source_close(src_);
    if (rd != size) {
        throw RedlineException(ErrorCode::Internal, "short read of archive buffer");
    }

    data_.clear();
    return out;
}

} // namespace redline
