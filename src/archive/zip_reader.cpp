#include "uberpack/zip.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <ostream>
#include <sstream>
#include <zlib.h>

namespace uberpack {

// ============================================================================
// Zip Format Layout
// ============================================================================

static constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
static constexpr size_t ZIP_END_RECORD_SIZE = 22;
static constexpr size_t ZIP_MAX_COMMENT_SIZE = 0xFFFF;
static constexpr size_t ZIP64_END_RECORD_SIZE = 56;
static constexpr size_t ZIP64_LOCATOR_SIZE = 20;

// ============================================================================
// Helper Functions
// ============================================================================

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64(const uint8_t* p) {
    return static_cast<uint64_t>(read_u32(p)) | (static_cast<uint64_t>(read_u32(p + 4)) << 32);
}

// Find the "UT" mtime in an extra field block
static std::optional<int64_t> parse_extended_mtime(const uint8_t* extra, size_t size) {
    size_t offset = 0;
    while (offset + 4 <= size) {
        uint16_t tag = read_u16(extra + offset);
        uint16_t len = read_u16(extra + offset + 2);
        offset += 4;
        if (offset + len > size) {
            break;
        }
        if (tag == ZIP_EXTRA_EXT_TIMESTAMP && len >= 5 && (extra[offset] & 0x01)) {
            return static_cast<int64_t>(static_cast<int32_t>(read_u32(extra + offset + 1)));
        }
        offset += len;
    }
    return std::nullopt;
}

// Replace saturated sizes and offset with the values from the ZIP64 extra
// field. Only the saturated fields are present, in this order.
static bool apply_zip64_extra(const uint8_t* extra, size_t size, ZipEntryInfo& entry) {
    size_t offset = 0;
    while (offset + 4 <= size) {
        uint16_t tag = read_u16(extra + offset);
        uint16_t len = read_u16(extra + offset + 2);
        offset += 4;
        if (offset + len > size) {
            break;
        }
        if (tag == ZIP_EXTRA_ZIP64) {
            const uint8_t* p = extra + offset;
            const uint8_t* end = p + len;
            uint64_t* fields[] = {&entry.uncompressed_size, &entry.compressed_size,
                                  &entry.local_header_offset};
            for (uint64_t* field : fields) {
                if (*field != ZIP64_MARKER_32) {
                    continue;
                }
                if (p + 8 > end) {
                    return false;
                }
                *field = read_u64(p);
                p += 8;
            }
            return true;
        }
        offset += len;
    }
    return false;
}

// Owns a raw-deflate inflater for the duration of one entry
struct InflateStream {
    z_stream strm;
    bool initialized = false;

    InflateStream() {
        std::memset(&strm, 0, sizeof(strm));
        initialized = inflateInit2(&strm, -15) == Z_OK;
    }

    ~InflateStream() {
        if (initialized) {
            inflateEnd(&strm);
        }
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

// ============================================================================
// Timestamps
// ============================================================================

int64_t dos_to_unix_time(uint16_t dos_date, uint16_t dos_time) {
    std::tm tm_buf;
    std::memset(&tm_buf, 0, sizeof(tm_buf));
    tm_buf.tm_year = ((dos_date >> 9) & 0x7F) + 80;
    tm_buf.tm_mon = ((dos_date >> 5) & 0x0F) - 1;
    tm_buf.tm_mday = dos_date & 0x1F;
    tm_buf.tm_hour = (dos_time >> 11) & 0x1F;
    tm_buf.tm_min = (dos_time >> 5) & 0x3F;
    tm_buf.tm_sec = (dos_time & 0x1F) * 2;
    tm_buf.tm_isdst = -1;
    return static_cast<int64_t>(std::mktime(&tm_buf));
}

int64_t ZipEntryInfo::last_modified() const {
    if (extended_mtime) {
        return *extended_mtime;
    }
    return dos_to_unix_time(dos_date, dos_time);
}

// ============================================================================
// ZipReader
// ============================================================================

ZipResult ZipReader::open() {
    ZipResult result;

    in_.open(path_, std::ios::binary);
    if (!in_) {
        result.error = "failed to open archive: " + path_;
        return result;
    }

    in_.seekg(0, std::ios::end);
    auto end_pos = in_.tellg();
    if (end_pos < 0) {
        result.error = "failed to determine archive size: " + path_;
        return result;
    }
    file_size_ = static_cast<uint64_t>(end_pos);

    if (file_size_ < ZIP_END_RECORD_SIZE) {
        result.error = "not a zip archive (too small): " + path_;
        return result;
    }

    // The end record sits in the last 22 bytes plus an optional comment
    uint64_t tail_size = std::min<uint64_t>(file_size_, ZIP_END_RECORD_SIZE + ZIP_MAX_COMMENT_SIZE);
    std::vector<uint8_t> tail(static_cast<size_t>(tail_size));
    in_.seekg(static_cast<std::streamoff>(file_size_ - tail_size));
    in_.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tail_size));
    if (static_cast<uint64_t>(in_.gcount()) != tail_size) {
        result.error = "failed to read archive trailer: " + path_;
        return result;
    }

    const uint8_t* end_record = nullptr;
    for (size_t i = tail.size() - ZIP_END_RECORD_SIZE + 1; i-- > 0;) {
        if (read_u32(tail.data() + i) == ZIP_END_OF_CENTRAL_DIR_SIG) {
            end_record = tail.data() + i;
            break;
        }
    }
    if (!end_record) {
        result.error = "not a zip archive (no end of central directory): " + path_;
        return result;
    }

    uint64_t end_offset = file_size_ - tail_size + static_cast<uint64_t>(end_record - tail.data());
    uint64_t total_entries = read_u16(end_record + 10);
    uint64_t cd_size = read_u32(end_record + 12);
    uint64_t cd_offset = read_u32(end_record + 16);
    bool saturated = total_entries == ZIP64_MARKER_16 || cd_size == ZIP64_MARKER_32 ||
                     cd_offset == ZIP64_MARKER_32;

    // A ZIP64 locator directly before the end record points at the real values
    uint8_t locator[ZIP64_LOCATOR_SIZE];
    bool has_locator = false;
    if (end_offset >= ZIP64_LOCATOR_SIZE) {
        auto read = read_at(end_offset - ZIP64_LOCATOR_SIZE, locator, ZIP64_LOCATOR_SIZE);
        if (!read.ok) {
            return read;
        }
        has_locator = read_u32(locator) == ZIP64_END_LOCATOR_SIG;
    }

    if (has_locator) {
        uint64_t record_offset = read_u64(locator + 8);
        if (record_offset + ZIP64_END_RECORD_SIZE > end_offset) {
            result.error = "ZIP64 end of central directory out of bounds: " + path_;
            return result;
        }
        uint8_t record[ZIP64_END_RECORD_SIZE];
        auto read = read_at(record_offset, record, ZIP64_END_RECORD_SIZE);
        if (!read.ok) {
            return read;
        }
        if (read_u32(record) != ZIP64_END_OF_CENTRAL_DIR_SIG) {
            result.error = "corrupt ZIP64 end of central directory: " + path_;
            return result;
        }
        total_entries = read_u64(record + 32);
        cd_size = read_u64(record + 40);
        cd_offset = read_u64(record + 48);
    } else if (saturated) {
        result.error = "missing ZIP64 end of central directory locator: " + path_;
        return result;
    }

    if (cd_offset > file_size_ || cd_size > file_size_ - cd_offset) {
        result.error = "central directory out of bounds: " + path_;
        return result;
    }
    // Every central header takes at least 46 bytes
    if (total_entries > cd_size / ZIP_CENTRAL_HEADER_SIZE) {
        result.error = "entry count exceeds central directory size: " + path_;
        return result;
    }

    return read_central_directory(cd_offset, cd_size, total_entries);
}

ZipResult ZipReader::read_at(uint64_t offset, void* data, size_t size) {
    ZipResult result;
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    in_.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(in_.gcount()) != size) {
        result.error = "failed to read archive: " + path_;
        return result;
    }
    result.ok = true;
    return result;
}

ZipResult ZipReader::read_central_directory(uint64_t offset, uint64_t size, uint64_t count) {
    ZipResult result;

    std::vector<uint8_t> cd(static_cast<size_t>(size));
    if (!read_at(offset, cd.data(), cd.size()).ok) {
        result.error = "failed to read central directory: " + path_;
        return result;
    }

    entries_.clear();
    entries_.reserve(static_cast<size_t>(count));

    size_t pos = 0;
    for (uint64_t i = 0; i < count; ++i) {
        if (pos + ZIP_CENTRAL_HEADER_SIZE > cd.size() ||
            read_u32(cd.data() + pos) != ZIP_CENTRAL_HEADER_SIG) {
            result.error = "corrupt central directory entry " + std::to_string(i) + ": " + path_;
            return result;
        }
        const uint8_t* h = cd.data() + pos;

        ZipEntryInfo entry;
        entry.flags = read_u16(h + 8);
        entry.method = read_u16(h + 10);
        entry.dos_time = read_u16(h + 12);
        entry.dos_date = read_u16(h + 14);
        entry.crc32 = read_u32(h + 16);
        entry.compressed_size = read_u32(h + 20);
        entry.uncompressed_size = read_u32(h + 24);
        uint16_t name_len = read_u16(h + 28);
        uint16_t extra_len = read_u16(h + 30);
        uint16_t comment_len = read_u16(h + 32);
        entry.local_header_offset = read_u32(h + 42);

        size_t record_size = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_size > cd.size()) {
            result.error = "truncated central directory entry " + std::to_string(i) + ": " + path_;
            return result;
        }

        entry.name.assign(reinterpret_cast<const char*>(h + ZIP_CENTRAL_HEADER_SIZE), name_len);
        const uint8_t* extra = h + ZIP_CENTRAL_HEADER_SIZE + name_len;
        entry.extended_mtime = parse_extended_mtime(extra, extra_len);

        if (entry.compressed_size == ZIP64_MARKER_32 || entry.uncompressed_size == ZIP64_MARKER_32 ||
            entry.local_header_offset == ZIP64_MARKER_32) {
            if (!apply_zip64_extra(extra, extra_len, entry)) {
                result.error = "missing ZIP64 extra field for entry: " + entry.name;
                return result;
            }
        }

        entries_.push_back(std::move(entry));
        pos += record_size;
    }

    result.ok = true;
    return result;
}

ZipResult ZipReader::seek_to_data(const ZipEntryInfo& entry) {
    ZipResult result;

    uint8_t header[ZIP_LOCAL_HEADER_SIZE];
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(entry.local_header_offset));
    in_.read(reinterpret_cast<char*>(header), ZIP_LOCAL_HEADER_SIZE);
    if (in_.gcount() != static_cast<std::streamsize>(ZIP_LOCAL_HEADER_SIZE) ||
        read_u32(header) != ZIP_LOCAL_HEADER_SIG) {
        result.error = "corrupt local header for entry: " + entry.name;
        return result;
    }

    uint64_t data_offset = entry.local_header_offset + ZIP_LOCAL_HEADER_SIZE +
                           read_u16(header + 26) + read_u16(header + 28);
    if (data_offset > file_size_ || entry.compressed_size > file_size_ - data_offset) {
        result.error = "entry data out of bounds: " + entry.name;
        return result;
    }

    in_.seekg(static_cast<std::streamoff>(data_offset));
    result.ok = true;
    return result;
}

ZipResult ZipReader::read_entry(const ZipEntryInfo& entry, std::ostream& out,
                                std::vector<char>& buffer) {
    ZipResult result;

    if (entry.flags & ZIP_FLAG_ENCRYPTED) {
        result.error = "encrypted entries are not supported: " + entry.name;
        return result;
    }
    if (entry.method != ZIP_METHOD_STORED && entry.method != ZIP_METHOD_DEFLATED) {
        result.error = "unsupported compression method " + std::to_string(entry.method) +
                       " for entry: " + entry.name;
        return result;
    }

    auto seek = seek_to_data(entry);
    if (!seek.ok) {
        return seek;
    }

    if (buffer.size() < 2) {
        buffer.resize(ZIP_COPY_BUFFER_SIZE);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t remaining = entry.compressed_size;
    uint64_t written = 0;

    if (entry.method == ZIP_METHOD_STORED) {
        while (remaining > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            in_.read(buffer.data(), static_cast<std::streamsize>(chunk));
            if (static_cast<size_t>(in_.gcount()) != chunk) {
                result.error = "unexpected end of data in entry: " + entry.name;
                return result;
            }
            crc = crc32(crc, reinterpret_cast<const Bytef*>(buffer.data()), static_cast<uInt>(chunk));
            out.write(buffer.data(), static_cast<std::streamsize>(chunk));
            remaining -= chunk;
            written += chunk;
        }
    } else {
        // First half of the buffer receives compressed input, second half output
        size_t half = buffer.size() / 2;
        char* in_buf = buffer.data();
        char* out_buf = buffer.data() + half;

        InflateStream inflater;
        if (!inflater.initialized) {
            result.error = "inflateInit2 failed for entry: " + entry.name;
            return result;
        }
        z_stream& strm = inflater.strm;

        int ret = Z_OK;
        bool output_full = false;
        while (ret != Z_STREAM_END) {
            // A full output buffer may still leave buffered output to drain
            if (strm.avail_in == 0 && !output_full) {
                if (remaining == 0) {
                    result.error = "truncated compressed data in entry: " + entry.name;
                    return result;
                }
                size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, half));
                in_.read(in_buf, static_cast<std::streamsize>(chunk));
                if (static_cast<size_t>(in_.gcount()) != chunk) {
                    result.error = "unexpected end of data in entry: " + entry.name;
                    return result;
                }
                remaining -= chunk;
                strm.next_in = reinterpret_cast<Bytef*>(in_buf);
                strm.avail_in = static_cast<uInt>(chunk);
            }

            strm.next_out = reinterpret_cast<Bytef*>(out_buf);
            strm.avail_out = static_cast<uInt>(half);

            ret = inflate(&strm, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
                ret == Z_STREAM_ERROR) {
                result.error = "corrupt compressed data in entry: " + entry.name;
                return result;
            }

            output_full = strm.avail_out == 0;
            size_t produced = half - strm.avail_out;
            if (produced > 0) {
                crc = crc32(crc, reinterpret_cast<const Bytef*>(out_buf), static_cast<uInt>(produced));
                out.write(out_buf, static_cast<std::streamsize>(produced));
                written += produced;
            }
        }
    }

    if (!out) {
        result.error = "failed to write contents of entry: " + entry.name;
        return result;
    }
    if (written != entry.uncompressed_size) {
        result.error = "size mismatch in entry: " + entry.name;
        return result;
    }
    if (static_cast<uint32_t>(crc) != entry.crc32) {
        result.error = "CRC-32 mismatch in entry: " + entry.name;
        return result;
    }

    result.ok = true;
    return result;
}

ZipResult ZipReader::read_entry(const ZipEntryInfo& entry, std::string& out) {
    std::ostringstream ss;
    std::vector<char> buffer(ZIP_COPY_BUFFER_SIZE);
    auto result = read_entry(entry, ss, buffer);
    if (result.ok) {
        out = ss.str();
    }
    return result;
}

} // namespace uberpack
