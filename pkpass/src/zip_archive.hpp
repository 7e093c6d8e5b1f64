#pragma once
#include <cstdint>
#include <ctime>
#include <fstream>
#include <string>
#include <vector>

// Minimal zip container support: what a pass bundle needs and nothing
// more. Single disk, no zip64, no encryption, stored or raw-deflate
// entries, UTF-8 names with '/' separators.
//
// Local header (30 B + name)      Central header (46 B + name)
//   sig        0x04034b50           sig        0x02014b50
//   version    20                   made by    0x0314 (unix, 2.0)
//   flags      0x0800 (UTF-8)       ...same fields as local...
//   method     0 | 8                external   unix mode << 16
//   dos time/date, crc32,           offset     of local header
//   csize, usize, name len, 0
//
// End of central directory (22 B): 0x06054b50, counts, size, offset.

namespace zip_archive {

class ZipWriter {
public:
    // Truncates or creates path. Throws ArchiveError if it cannot be opened.
    explicit ZipWriter(const std::string& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // name without trailing '/'; one is appended.
    void add_directory(const std::string& name, std::time_t mtime);

    // Deflated when that makes the entry smaller, stored otherwise.
    void add_file(const std::string& name, const std::vector<uint8_t>& data, std::time_t mtime);

    // Writes the central directory. Throws ArchiveError on write failure.
    void close();

private:
    struct CentralEntry {
        std::string name;
        uint16_t    method;
        uint16_t    dos_time;
        uint16_t    dos_date;
        uint32_t    crc;
        uint32_t    csize;
        uint32_t    usize;
        uint32_t    external_attr;
        uint32_t    offset;
    };

    void add_entry(CentralEntry e, const std::vector<uint8_t>& payload);
    void write_bytes(const std::vector<uint8_t>& buf);

    std::string               path_;
    std::ofstream             out_;
    std::vector<CentralEntry> entries_;
    uint64_t                  offset_ = 0;
    bool                      closed_ = false;
};

struct ZipEntry {
    std::string          name;          // directories end in '/'
    bool                 is_directory = false;
    std::vector<uint8_t> data;
};

// Reads every entry, inflating and CRC-checking file data.
// Throws ArchiveError on malformed or unsupported archives.
std::vector<ZipEntry> read_archive(const std::string& path);

// Archives everything below source into dest: a directory entry for
// every directory (empty ones included) ahead of its contents, and every
// regular file under its path relative to source. A partially written
// dest is removed on failure. Throws ArchiveError.
void zip_directory(const std::string& source, const std::string& dest);

} // namespace zip_archive
