// cpp/include/redline/zip_io.h
#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

struct zip;
struct zip_source;

namespace redline {

// Central-directory view of one entry. Never requires inflating the payload.
struct ArchiveEntry {
    std::string path;
    uint64_t compressed_size{0};
    uint64_t uncompressed_size{0};
    bool is_directory{false};
    uint64_t index{0};
};

// Hard cap on bytes actually produced by decompression of one input.
// Shared across every entry read from the same upload.
class ReadBudget {
public:
    explicit ReadBudget(uint64_t max_bytes) : max_bytes_(max_bytes) {}

    // throws RedlineException(BombSuspected) once the cap is crossed
    void consume(uint64_t n);

    uint64_t used() const { return used_; }
    uint64_t max_bytes() const { return max_bytes_; }

private:
    uint64_t max_bytes_;
    uint64_t used_{0};
};

// Read-only archive over a borrowed in-memory buffer.
// The buffer must outlive the reader.
class ZipReader {
public:
    // throws RedlineException(CorruptArchive) if the central directory is unreadable
    explicit ZipReader(std::string_view bytes);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    const std::vector<ArchiveEntry>& entries() const { return entries_; }

    // Inflates one entry. Fails with CorruptArchive on read errors or when the
    // entry yields more bytes than its declared size.
    std::string read(const ArchiveEntry& e, ReadBudget& budget);

    // Payload bytes inflated so far through this reader.
    uint64_t payload_bytes_read() const { return payload_bytes_read_; }

private:
    zip* za_{nullptr};
    std::vector<ArchiveEntry> entries_;
    uint64_t payload_bytes_read_{0};
};

// Builds a new archive in memory.
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // level 0 => stored, 1..9 => deflate at that level
    void add(const std::string& path, std::string data, int level);

    // Finalizes the archive and returns its bytes. The writer is spent afterwards.
    std::string finish();

    size_t size() const { return data_.size(); }

private:
    zip_source* src_{nullptr};
    zip* za_{nullptr};
    std::deque<std::string> data_; // stable storage until zip_close
};

} // namespace redline
