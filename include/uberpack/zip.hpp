#pragma once

#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace uberpack {

// ============================================================================
// Zip Format Constants
// ============================================================================

inline constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
inline constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
inline constexpr uint32_t ZIP_END_OF_CENTRAL_DIR_SIG = 0x06054b50;
inline constexpr uint32_t ZIP_DATA_DESCRIPTOR_SIG = 0x08074b50;
inline constexpr uint32_t ZIP64_END_OF_CENTRAL_DIR_SIG = 0x06064b50;
inline constexpr uint32_t ZIP64_END_LOCATOR_SIG = 0x07064b50;

inline constexpr uint16_t ZIP_METHOD_STORED = 0;
inline constexpr uint16_t ZIP_METHOD_DEFLATED = 8;

inline constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;
inline constexpr uint16_t ZIP_FLAG_DATA_DESCRIPTOR = 0x0008;
inline constexpr uint16_t ZIP_FLAG_UTF8 = 0x0800;

// Extra field tags
inline constexpr uint16_t ZIP_EXTRA_ZIP64 = 0x0001;
inline constexpr uint16_t ZIP_EXTRA_EXT_TIMESTAMP = 0x5455;  // "UT"

// 32-bit and 16-bit fields saturated to these values defer to ZIP64 records
inline constexpr uint32_t ZIP64_MARKER_32 = 0xFFFFFFFF;
inline constexpr uint16_t ZIP64_MARKER_16 = 0xFFFF;

// Default size of the reusable copy buffer
inline constexpr size_t ZIP_COPY_BUFFER_SIZE = 16 * 1024;

// ============================================================================
// Entries
// ============================================================================

struct ZipEntryInfo {
    std::string name;                 // Forward slashes; directories end in '/'
    uint16_t method = ZIP_METHOD_STORED;
    uint16_t flags = 0;
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    std::optional<int64_t> extended_mtime;  // From the "UT" extra field
    uint64_t local_header_offset = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }

    // Seconds since the Unix epoch. The extended timestamp wins; otherwise
    // the DOS fields are read as local time.
    int64_t last_modified() const;
};

struct ZipResult {
    bool ok = false;
    std::string error;
};

// DOS date/time <-> Unix seconds, local time
int64_t dos_to_unix_time(uint16_t dos_date, uint16_t dos_time);
void unix_to_dos_time(int64_t unix_seconds, uint16_t& dos_date, uint16_t& dos_time);

// ============================================================================
// Zip Reader
// ============================================================================

// Reads the central directory up front, then streams entry bodies on demand.
// Only the directory metadata is held in memory. ZIP64 end records and
// per-entry ZIP64 extra fields are honoured.
class ZipReader {
public:
    explicit ZipReader(std::string path) : path_(std::move(path)) {}

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // Open the archive and read its central directory
    ZipResult open();

    const std::vector<ZipEntryInfo>& entries() const { return entries_; }

    // Decompress one entry into out. buffer is scratch space reused across
    // calls; it is resized if smaller than two bytes. The CRC-32 and size of
    // the decompressed body are verified.
    ZipResult read_entry(const ZipEntryInfo& entry, std::ostream& out, std::vector<char>& buffer);

    // Convenience: decompress one entry into a string
    ZipResult read_entry(const ZipEntryInfo& entry, std::string& out);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream in_;
    uint64_t file_size_ = 0;
    std::vector<ZipEntryInfo> entries_;

    ZipResult read_at(uint64_t offset, void* data, size_t size);
    ZipResult read_central_directory(uint64_t offset, uint64_t size, uint64_t count);
    ZipResult seek_to_data(const ZipEntryInfo& entry);
};

// ============================================================================
// Zip Writer
// ============================================================================

// Writes entries sequentially; file bodies are deflated while streaming and
// followed by a data descriptor. finish() writes the central directory.
// ZIP64 records are added only where a count, size or offset needs them.
class ZipWriter {
public:
    explicit ZipWriter(std::string path) : path_(std::move(path)) {}

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipResult open();

    // name must not end in '/'; one is appended
    ZipResult add_directory(const std::string& name, int64_t mtime);

    // Deflate the remaining content of in as entry name
    ZipResult add_stream(const std::string& name, std::istream& in, int64_t mtime);

    ZipResult add_bytes(const std::string& name, const std::string& data, int64_t mtime);

    // Write the central directory and close the file
    ZipResult finish();

    size_t entry_count() const { return entries_.size(); }

    bool contains(const std::string& name) const;

private:
    std::string path_;
    std::ofstream out_;
    uint64_t offset_ = 0;
    std::vector<ZipEntryInfo> entries_;
    std::unordered_set<std::string> names_;
    std::vector<char> buffer_;
    bool finished_ = false;

    ZipResult begin_entry(ZipEntryInfo& entry, int64_t mtime);
    ZipResult write_raw(const void* data, size_t size);
};

} // namespace uberpack
