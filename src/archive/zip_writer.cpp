#include "uberpack/zip.hpp"

#include <cstring>
#include <ctime>
#include <istream>
#include <sstream>
#include <zlib.h>

namespace uberpack {

static constexpr uint16_t ZIP_VERSION_NEEDED = 20;
static constexpr uint16_t ZIP_VERSION_ZIP64 = 45;
static constexpr uint32_t ZIP_DOS_DIRECTORY_ATTR = 0x10;

// Size of the ZIP64 end record after its signature and size fields
static constexpr uint64_t ZIP64_END_RECORD_BODY_SIZE = 44;

// ============================================================================
// Helper Functions
// ============================================================================

static void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

static void put_u32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
    out.push_back(static_cast<char>((v >> 16) & 0xff));
    out.push_back(static_cast<char>((v >> 24) & 0xff));
}

static void put_u64(std::string& out, uint64_t v) {
    put_u32(out, static_cast<uint32_t>(v & 0xFFFFFFFFULL));
    put_u32(out, static_cast<uint32_t>(v >> 32));
}

// 32-bit field value: the marker when the real value lives in a ZIP64 record
static uint32_t field_u32(uint64_t v) {
    return v >= ZIP64_MARKER_32 ? ZIP64_MARKER_32 : static_cast<uint32_t>(v);
}

// "UT" extra field carrying only the modification time
static std::string extended_timestamp_extra(int64_t mtime) {
    std::string extra;
    put_u16(extra, ZIP_EXTRA_EXT_TIMESTAMP);
    put_u16(extra, 5);
    extra.push_back(0x01);
    put_u32(extra, static_cast<uint32_t>(static_cast<int32_t>(mtime)));
    return extra;
}

// Owns a raw-deflate compressor for the duration of one entry
struct DeflateStream {
    z_stream strm;
    bool initialized = false;

    DeflateStream() {
        std::memset(&strm, 0, sizeof(strm));
        initialized = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8,
                                   Z_DEFAULT_STRATEGY) == Z_OK;
    }

    ~DeflateStream() {
        if (initialized) {
            deflateEnd(&strm);
        }
    }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
};

void unix_to_dos_time(int64_t unix_seconds, uint16_t& dos_date, uint16_t& dos_time) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm_buf;
#ifdef _WIN32
    bool converted = localtime_s(&tm_buf, &t) == 0;
#else
    bool converted = localtime_r(&t, &tm_buf) != nullptr;
#endif

    int year = converted ? tm_buf.tm_year + 1900 : 1980;
    if (!converted || year < 1980) {
        // Earliest representable DOS time: 1980-01-01 00:00:00
        dos_date = static_cast<uint16_t>((1 << 5) | 1);
        dos_time = 0;
        return;
    }
    if (year > 2107) {
        dos_date = static_cast<uint16_t>((127 << 9) | (12 << 5) | 31);
        dos_time = static_cast<uint16_t>((23 << 11) | (59 << 5) | 29);
        return;
    }

    dos_date = static_cast<uint16_t>(((year - 1980) << 9) | ((tm_buf.tm_mon + 1) << 5) | tm_buf.tm_mday);
    dos_time = static_cast<uint16_t>((tm_buf.tm_hour << 11) | (tm_buf.tm_min << 5) | (tm_buf.tm_sec / 2));
}

// ============================================================================
// ZipWriter
// ============================================================================

ZipResult ZipWriter::open() {
    ZipResult result;

    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        result.error = "failed to open archive for writing: " + path_;
        return result;
    }
    buffer_.resize(ZIP_COPY_BUFFER_SIZE);

    result.ok = true;
    return result;
}

bool ZipWriter::contains(const std::string& name) const {
    return names_.count(name) > 0;
}

ZipResult ZipWriter::write_raw(const void* data, size_t size) {
    ZipResult result;
    out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        result.error = "failed to write archive: " + path_;
        return result;
    }
    offset_ += size;
    result.ok = true;
    return result;
}

ZipResult ZipWriter::begin_entry(ZipEntryInfo& entry, int64_t mtime) {
    ZipResult result;

    if (finished_ || !out_.is_open()) {
        result.error = "archive is not open for writing: " + path_;
        return result;
    }
    if (entry.name.empty() || entry.name == "/") {
        result.error = "empty entry name";
        return result;
    }
    if (contains(entry.name)) {
        result.error = "duplicate entry: " + entry.name;
        return result;
    }
    unix_to_dos_time(mtime, entry.dos_date, entry.dos_time);
    entry.extended_mtime = mtime;
    entry.local_header_offset = offset_;

    std::string extra = extended_timestamp_extra(mtime);

    std::string header;
    put_u32(header, ZIP_LOCAL_HEADER_SIG);
    put_u16(header, ZIP_VERSION_NEEDED);
    put_u16(header, entry.flags);
    put_u16(header, entry.method);
    put_u16(header, entry.dos_time);
    put_u16(header, entry.dos_date);
    // CRC and sizes follow in the data descriptor when streaming
    put_u32(header, entry.crc32);
    put_u32(header, static_cast<uint32_t>(entry.compressed_size));
    put_u32(header, static_cast<uint32_t>(entry.uncompressed_size));
    put_u16(header, static_cast<uint16_t>(entry.name.size()));
    put_u16(header, static_cast<uint16_t>(extra.size()));
    header += entry.name;
    header += extra;

    return write_raw(header.data(), header.size());
}

ZipResult ZipWriter::add_directory(const std::string& name, int64_t mtime) {
    ZipEntryInfo entry;
    entry.name = name + "/";
    entry.method = ZIP_METHOD_STORED;
    entry.flags = ZIP_FLAG_UTF8;

    auto result = begin_entry(entry, mtime);
    if (!result.ok) {
        return result;
    }

    names_.insert(entry.name);
    entries_.push_back(std::move(entry));
    return result;
}

ZipResult ZipWriter::add_stream(const std::string& name, std::istream& in, int64_t mtime) {
    ZipEntryInfo entry;
    entry.name = name;
    entry.method = ZIP_METHOD_DEFLATED;
    entry.flags = ZIP_FLAG_UTF8 | ZIP_FLAG_DATA_DESCRIPTOR;

    auto result = begin_entry(entry, mtime);
    if (!result.ok) {
        return result;
    }
    result.ok = false;

    DeflateStream deflater;
    if (!deflater.initialized) {
        result.error = "deflateInit2 failed for entry: " + name;
        return result;
    }
    z_stream& strm = deflater.strm;

    // First half of the buffer holds input, second half compressed output
    size_t half = buffer_.size() / 2;
    char* in_buf = buffer_.data();
    char* out_buf = buffer_.data() + half;

    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total_in = 0;
    uint64_t total_out = 0;

    int flush = Z_NO_FLUSH;
    do {
        in.read(in_buf, static_cast<std::streamsize>(half));
        if (in.bad()) {
            result.error = "failed to read contents for entry: " + name;
            return result;
        }
        size_t got = static_cast<size_t>(in.gcount());
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf), static_cast<uInt>(got));
        total_in += got;

        strm.next_in = reinterpret_cast<Bytef*>(in_buf);
        strm.avail_in = static_cast<uInt>(got);

        do {
            strm.next_out = reinterpret_cast<Bytef*>(out_buf);
            strm.avail_out = static_cast<uInt>(half);
            if (deflate(&strm, flush) == Z_STREAM_ERROR) {
                result.error = "deflate failed for entry: " + name;
                return result;
            }
            size_t have = half - strm.avail_out;
            if (have > 0) {
                auto write = write_raw(out_buf, have);
                if (!write.ok) {
                    return write;
                }
                total_out += have;
            }
        } while (strm.avail_out == 0);
    } while (flush != Z_FINISH);

    entry.crc32 = static_cast<uint32_t>(crc);
    entry.compressed_size = total_out;
    entry.uncompressed_size = total_in;

    // Sizes that do not fit 32 bits take the 8-byte descriptor form
    std::string descriptor;
    put_u32(descriptor, ZIP_DATA_DESCRIPTOR_SIG);
    put_u32(descriptor, entry.crc32);
    if (total_in >= ZIP64_MARKER_32 || total_out >= ZIP64_MARKER_32) {
        put_u64(descriptor, entry.compressed_size);
        put_u64(descriptor, entry.uncompressed_size);
    } else {
        put_u32(descriptor, static_cast<uint32_t>(entry.compressed_size));
        put_u32(descriptor, static_cast<uint32_t>(entry.uncompressed_size));
    }
    auto write = write_raw(descriptor.data(), descriptor.size());
    if (!write.ok) {
        return write;
    }

    names_.insert(entry.name);
    entries_.push_back(std::move(entry));
    result.ok = true;
    return result;
}

ZipResult ZipWriter::add_bytes(const std::string& name, const std::string& data, int64_t mtime) {
    std::istringstream in(data);
    return add_stream(name, in, mtime);
}

ZipResult ZipWriter::finish() {
    ZipResult result;

    if (finished_ || !out_.is_open()) {
        result.error = "archive is not open for writing: " + path_;
        return result;
    }

    uint64_t cd_offset = offset_;
    for (const auto& entry : entries_) {
        std::string extra;
        std::string zip64;
        if (entry.uncompressed_size >= ZIP64_MARKER_32) put_u64(zip64, entry.uncompressed_size);
        if (entry.compressed_size >= ZIP64_MARKER_32) put_u64(zip64, entry.compressed_size);
        if (entry.local_header_offset >= ZIP64_MARKER_32) put_u64(zip64, entry.local_header_offset);
        if (!zip64.empty()) {
            put_u16(extra, ZIP_EXTRA_ZIP64);
            put_u16(extra, static_cast<uint16_t>(zip64.size()));
            extra += zip64;
        }
        extra += extended_timestamp_extra(entry.extended_mtime.value_or(0));
        uint16_t version = zip64.empty() ? ZIP_VERSION_NEEDED : ZIP_VERSION_ZIP64;

        std::string header;
        put_u32(header, ZIP_CENTRAL_HEADER_SIG);
        put_u16(header, version);  // version made by
        put_u16(header, version);
        put_u16(header, entry.flags);
        put_u16(header, entry.method);
        put_u16(header, entry.dos_time);
        put_u16(header, entry.dos_date);
        put_u32(header, entry.crc32);
        put_u32(header, field_u32(entry.compressed_size));
        put_u32(header, field_u32(entry.uncompressed_size));
        put_u16(header, static_cast<uint16_t>(entry.name.size()));
        put_u16(header, static_cast<uint16_t>(extra.size()));
        put_u16(header, 0);  // comment length
        put_u16(header, 0);  // disk number start
        put_u16(header, 0);  // internal attributes
        put_u32(header, entry.is_directory() ? ZIP_DOS_DIRECTORY_ATTR : 0);
        put_u32(header, field_u32(entry.local_header_offset));
        header += entry.name;
        header += extra;

        auto write = write_raw(header.data(), header.size());
        if (!write.ok) {
            return write;
        }
    }
    uint64_t cd_size = offset_ - cd_offset;
    uint64_t count = entries_.size();

    if (count >= ZIP64_MARKER_16 || cd_size >= ZIP64_MARKER_32 || cd_offset >= ZIP64_MARKER_32) {
        uint64_t record_offset = offset_;

        std::string record;
        put_u32(record, ZIP64_END_OF_CENTRAL_DIR_SIG);
        put_u64(record, ZIP64_END_RECORD_BODY_SIZE);
        put_u16(record, ZIP_VERSION_ZIP64);  // version made by
        put_u16(record, ZIP_VERSION_ZIP64);
        put_u32(record, 0);  // this disk
        put_u32(record, 0);  // central directory disk
        put_u64(record, count);
        put_u64(record, count);
        put_u64(record, cd_size);
        put_u64(record, cd_offset);

        put_u32(record, ZIP64_END_LOCATOR_SIG);
        put_u32(record, 0);  // disk holding the ZIP64 end record
        put_u64(record, record_offset);
        put_u32(record, 1);  // total disks

        auto write = write_raw(record.data(), record.size());
        if (!write.ok) {
            return write;
        }
    }

    uint16_t count_field = count >= ZIP64_MARKER_16 ? ZIP64_MARKER_16 : static_cast<uint16_t>(count);

    std::string end_record;
    put_u32(end_record, ZIP_END_OF_CENTRAL_DIR_SIG);
    put_u16(end_record, 0);  // this disk
    put_u16(end_record, 0);  // central directory disk
    put_u16(end_record, count_field);
    put_u16(end_record, count_field);
    put_u32(end_record, field_u32(cd_size));
    put_u32(end_record, field_u32(cd_offset));
    put_u16(end_record, 0);  // comment length
    auto write = write_raw(end_record.data(), end_record.size());
    if (!write.ok) {
        return write;
    }

    out_.close();
    finished_ = true;
    if (out_.fail()) {
        result.error = "failed to close archive: " + path_;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace uberpack
