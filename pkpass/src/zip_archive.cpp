#include "zip_archive.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include <zlib.h>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

namespace zip_archive {

static const uint32_t kLocalSig   = 0x04034b50;
static const uint32_t kCentralSig = 0x02014b50;
static const uint32_t kEndSig     = 0x06054b50;

static const uint16_t kVersion     = 20;       // 2.0: deflate, directories
static const uint16_t kMadeByUnix  = 0x0314;
static const uint16_t kFlagUtf8    = 0x0800;
static const uint16_t kStored      = 0;
static const uint16_t kDeflated    = 8;
static const uint32_t kDirAttr     = (040755u << 16) | 0x10;   // S_IFDIR | MS-DOS dir bit
static const uint32_t kFileAttr    = 0100644u << 16;

static const size_t kLocalHeaderSize   = 30;
static const size_t kCentralHeaderSize = 46;
static const size_t kEndRecordSize     = 22;

// ── little-endian helpers ─────────────────────────────────────────────────────

static void push_u16le(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
}

static void push_u32le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >>  8) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >> 24) & 0xFF);
}

static uint16_t read_u16le(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t read_u32le(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) |
           ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

// MS-DOS date/time in local time; the format cannot express years before 1980.
static void dos_datetime(std::time_t t, uint16_t& dos_time, uint16_t& dos_date) {
    struct tm lt;
    if (!localtime_r(&t, &lt) || lt.tm_year < 80) {
        dos_time = 0;
        dos_date = (0 << 9) | (1 << 5) | 1;   // 1980-01-01
        return;
    }
    dos_time = (uint16_t)((lt.tm_hour << 11) | (lt.tm_min << 5) | (lt.tm_sec / 2));
    dos_date = (uint16_t)(((lt.tm_year - 80) << 9) | ((lt.tm_mon + 1) << 5) | lt.tm_mday);
}

static uint32_t crc32_of(const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!data.empty())
        crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

// Raw deflate (no zlib header), as zip method 8 requires.
static std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
        throw ArchiveError("deflateInit2 failed");

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in   = const_cast<Bytef*>(data.data());
    zs.avail_in  = static_cast<uInt>(data.size());
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
        throw ArchiveError("deflate failed");
    out.resize(produced);
    return out;
}

static std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t len, size_t usize) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
        throw ArchiveError("inflateInit2 failed");

    std::vector<uint8_t> out(usize);
    zs.next_in   = const_cast<Bytef*>(data);
    zs.avail_in  = static_cast<uInt>(len);
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != usize)
        throw ArchiveError("inflate failed: corrupt deflate stream");
    return out;
}

// ── ZipWriter ─────────────────────────────────────────────────────────────────

ZipWriter::ZipWriter(const std::string& path)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc)
{
    if (!out_)
        throw ArchiveError("Could not create ZIP file at \"" + path + "\"");
}

ZipWriter::~ZipWriter() {
    if (out_.is_open())
        out_.close();
}

void ZipWriter::write_bytes(const std::vector<uint8_t>& buf) {
    out_.write(reinterpret_cast<const char*>(buf.data()),
               static_cast<std::streamsize>(buf.size()));
    if (!out_)
        throw ArchiveError("Write error on ZIP file \"" + path_ + "\"");
    offset_ += buf.size();
}

void ZipWriter::add_entry(CentralEntry e, const std::vector<uint8_t>& payload) {
    if (closed_)
        throw ArchiveError("ZIP file \"" + path_ + "\" is already closed");
    if (offset_ + kLocalHeaderSize + e.name.size() + payload.size() > 0xFFFFFFFFull ||
        e.name.size() > 0xFFFF)
        throw ArchiveError("ZIP file \"" + path_ + "\" would need zip64");

    e.offset = static_cast<uint32_t>(offset_);

    std::vector<uint8_t> hdr;
    hdr.reserve(kLocalHeaderSize + e.name.size());
    push_u32le(hdr, kLocalSig);
    push_u16le(hdr, kVersion);
    push_u16le(hdr, kFlagUtf8);
    push_u16le(hdr, e.method);
    push_u16le(hdr, e.dos_time);
    push_u16le(hdr, e.dos_date);
    push_u32le(hdr, e.crc);
    push_u32le(hdr, e.csize);
    push_u32le(hdr, e.usize);
    push_u16le(hdr, static_cast<uint16_t>(e.name.size()));
    push_u16le(hdr, 0);                                     // extra field
    hdr.insert(hdr.end(), e.name.begin(), e.name.end());

    write_bytes(hdr);
    write_bytes(payload);
    entries_.push_back(std::move(e));
}

void ZipWriter::add_directory(const std::string& name, std::time_t mtime) {
    CentralEntry e{};
    e.name          = name + "/";
    e.method        = kStored;
    e.external_attr = kDirAttr;
    dos_datetime(mtime, e.dos_time, e.dos_date);
    add_entry(std::move(e), {});
}

void ZipWriter::add_file(const std::string& name, const std::vector<uint8_t>& data,
                         std::time_t mtime)
{
    if (data.size() > 0xFFFFFFFFull)
        throw ArchiveError("ZIP entry \"" + name + "\" is too large");

    CentralEntry e{};
    e.name          = name;
    e.crc           = crc32_of(data);
    e.usize         = static_cast<uint32_t>(data.size());
    e.external_attr = kFileAttr;
    dos_datetime(mtime, e.dos_time, e.dos_date);

    std::vector<uint8_t> packed = data.empty() ? std::vector<uint8_t>() : deflate_raw(data);
    if (!data.empty() && packed.size() < data.size()) {
        e.method = kDeflated;
        e.csize  = static_cast<uint32_t>(packed.size());
        add_entry(std::move(e), packed);
    } else {
        e.method = kStored;
        e.csize  = e.usize;
        add_entry(std::move(e), data);
    }
}

void ZipWriter::close() {
    if (closed_) return;

    uint64_t cd_offset = offset_;
    std::vector<uint8_t> cd;
    for (const auto& e : entries_) {
        push_u32le(cd, kCentralSig);
        push_u16le(cd, kMadeByUnix);
        push_u16le(cd, kVersion);
        push_u16le(cd, kFlagUtf8);
        push_u16le(cd, e.method);
        push_u16le(cd, e.dos_time);
        push_u16le(cd, e.dos_date);
        push_u32le(cd, e.crc);
        push_u32le(cd, e.csize);
        push_u32le(cd, e.usize);
        push_u16le(cd, static_cast<uint16_t>(e.name.size()));
        push_u16le(cd, 0);          // extra
        push_u16le(cd, 0);          // comment
        push_u16le(cd, 0);          // disk number
        push_u16le(cd, 0);          // internal attributes
        push_u32le(cd, e.external_attr);
        push_u32le(cd, e.offset);
        cd.insert(cd.end(), e.name.begin(), e.name.end());
    }

    if (entries_.size() > 0xFFFF || cd_offset + cd.size() > 0xFFFFFFFFull)
        throw ArchiveError("ZIP file \"" + path_ + "\" would need zip64");

    std::vector<uint8_t> end;
    push_u32le(end, kEndSig);
    push_u16le(end, 0);
    push_u16le(end, 0);
    push_u16le(end, static_cast<uint16_t>(entries_.size()));
    push_u16le(end, static_cast<uint16_t>(entries_.size()));
    push_u32le(end, static_cast<uint32_t>(cd.size()));
    push_u32le(end, static_cast<uint32_t>(cd_offset));
    push_u16le(end, 0);

    write_bytes(cd);
    write_bytes(end);
    out_.close();
    if (!out_)
        throw ArchiveError("Write error on ZIP file \"" + path_ + "\"");
    closed_ = true;
}

// ── Reader ────────────────────────────────────────────────────────────────────

std::vector<ZipEntry> read_archive(const std::string& path) {
    std::vector<uint8_t> buf;
    try {
        buf = read_file(path);
    } catch (const std::runtime_error& e) {
        throw ArchiveError(e.what());
    }

    if (buf.size() < kEndRecordSize)
        throw ArchiveError("Not a ZIP file (too short): " + path);

    // End record sits in the last 22 + up to 65535 comment bytes.
    size_t end_pos = std::string::npos;
    size_t lowest  = buf.size() > kEndRecordSize + 0xFFFF ? buf.size() - kEndRecordSize - 0xFFFF : 0;
    for (size_t i = buf.size() - kEndRecordSize + 1; i-- > lowest;) {
        if (read_u32le(&buf[i]) == kEndSig) { end_pos = i; break; }
    }
    if (end_pos == std::string::npos)
        throw ArchiveError("Not a ZIP file (no end of central directory): " + path);

    const uint8_t* end = &buf[end_pos];
    uint16_t count     = read_u16le(end + 10);
    uint32_t cd_size   = read_u32le(end + 12);
    uint32_t cd_offset = read_u32le(end + 16);
    if ((uint64_t)cd_offset + cd_size > end_pos)
        throw ArchiveError("Corrupt ZIP file (central directory out of range): " + path);

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    size_t p = cd_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (p + kCentralHeaderSize > end_pos || read_u32le(&buf[p]) != kCentralSig)
            throw ArchiveError("Corrupt ZIP file (bad central header): " + path);
        const uint8_t* h = &buf[p];
        uint16_t flags    = read_u16le(h + 8);
        uint16_t method   = read_u16le(h + 10);
        uint32_t crc      = read_u32le(h + 16);
        uint32_t csize    = read_u32le(h + 20);
        uint32_t usize    = read_u32le(h + 24);
        uint16_t name_len = read_u16le(h + 28);
        uint16_t extra    = read_u16le(h + 30);
        uint16_t comment  = read_u16le(h + 32);
        uint32_t local    = read_u32le(h + 42);
        if (p + kCentralHeaderSize + name_len > end_pos)
            throw ArchiveError("Corrupt ZIP file (truncated name): " + path);
        if (flags & 0x0001)
            throw ArchiveError("Encrypted ZIP entries are not supported: " + path);

        ZipEntry entry;
        entry.name.assign(reinterpret_cast<const char*>(h + kCentralHeaderSize), name_len);
        entry.is_directory = !entry.name.empty() && entry.name.back() == '/';
        p += kCentralHeaderSize + name_len + extra + comment;

        if ((uint64_t)local + kLocalHeaderSize > cd_offset || read_u32le(&buf[local]) != kLocalSig)
            throw ArchiveError("Corrupt ZIP file (bad local header for " + entry.name + ")");
        size_t data_pos = local + kLocalHeaderSize +
                          read_u16le(&buf[local + 26]) + read_u16le(&buf[local + 28]);
        if ((uint64_t)data_pos + csize > cd_offset)
            throw ArchiveError("Corrupt ZIP file (data out of range for " + entry.name + ")");

        if (method == kStored) {
            if (csize != usize)
                throw ArchiveError("Corrupt ZIP file (stored size mismatch for " + entry.name + ")");
            entry.data.assign(buf.begin() + data_pos, buf.begin() + data_pos + csize);
        } else if (method == kDeflated) {
            entry.data = inflate_raw(&buf[data_pos], csize, usize);
        } else {
            throw ArchiveError("Unsupported ZIP compression method " + std::to_string(method) +
                               " for " + entry.name);
        }

        if (crc32_of(entry.data) != crc)
            throw ArchiveError("CRC mismatch for ZIP entry " + entry.name);

        entries.push_back(std::move(entry));
    }
    return entries;
}

// ── zip_directory ─────────────────────────────────────────────────────────────

static std::time_t mtime_of(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
        return std::time(nullptr);
    return st.st_mtime;
}

void zip_directory(const std::string& source, const std::string& dest) {
    std::string root = source;
    if (!root.empty() && root.back() != '/')
        root += '/';

    // An existing dest that cannot be opened is left alone.
    ZipWriter zip(dest);
    try {
        for (const auto& entry : walk_tree(source)) {
            std::string full = root + entry.relative;
            if (entry.is_directory) {
                zip.add_directory(entry.relative, mtime_of(full));
            } else {
                std::vector<uint8_t> data;
                try {
                    data = read_file(full);
                } catch (const std::runtime_error& e) {
                    throw ArchiveError(e.what());
                }
                zip.add_file(entry.relative, data, mtime_of(full));
            }
        }
        zip.close();
    } catch (const ArchiveError&) {
        remove_tree(dest);
        throw;
    } catch (const std::runtime_error& e) {
        remove_tree(dest);
        throw ArchiveError(e.what());
    }
}

} // namespace zip_archive
