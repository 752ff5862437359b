#include "uberpack/extractor.hpp"
#include "uberpack/edn.hpp"
#include "uberpack/merge_rules.hpp"
#include "uberpack/platform.hpp"
#include "uberpack/zip.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace uberpack {

namespace {

// Writes the body of one source file or archive entry to a stream
using ContentWriter = std::function<FileResult(std::ostream&)>;

struct ExplodeContext {
    fs::path working_dir;
    std::string source_path;
    const ExtractOptions& options;
    ExtractResult& result;
    std::vector<char> buffer;
};

bool fail(ExplodeContext& ctx, const std::string& message) {
    ctx.result.error = message;
    return false;
}

bool ensure_directory(ExplodeContext& ctx, const std::string& rel) {
    fs::path dir = ctx.working_dir / rel;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        return fail(ctx, "failed to create directory " + rel + " from " + ctx.source_path +
                             (ec ? ": " + ec.message() : ""));
    }
    return true;
}

bool merge_data_readers(ExplodeContext& ctx, const fs::path& target, const std::string& rel,
                        const ContentWriter& write_content) {
    auto existing_text = read_file(target.string());
    if (!existing_text) {
        return fail(ctx, "failed to read " + target.string());
    }

    std::ostringstream incoming_text;
    auto copied = write_content(incoming_text);
    if (!copied.ok) {
        return fail(ctx, ctx.source_path + ": " + copied.error);
    }

    auto existing = parse_data_readers(*existing_text);
    if (!existing.ok) {
        return fail(ctx, "malformed reader descriptor " + rel + " in working directory: " +
                             existing.error);
    }
    auto incoming = parse_data_readers(incoming_text.str());
    if (!incoming.ok) {
        return fail(ctx, "malformed reader descriptor " + rel + " in " + ctx.source_path + ": " +
                             incoming.error);
    }

    EdnValue merged = merge_edn_maps(existing.value, incoming.value);
    auto written = write_file(target.string(), pprint_edn(merged));
    if (!written.ok) {
        return fail(ctx, written.error);
    }

    ++ctx.result.files_merged;
    if (ctx.options.observer) {
        ctx.options.observer->on_data_readers_merged(rel, ctx.source_path);
    }
    return true;
}

// Apply exclusion and conflict policy to one file
bool place_file(ExplodeContext& ctx, const std::string& entry_name, int64_t mtime,
                const ContentWriter& write_content) {
    auto validation = validate_entry_path(entry_name);
    if (!validation.safe) {
        return fail(ctx, "unsafe entry in " + ctx.source_path + ": " + validation.error);
    }
    const std::string& rel = validation.normalized_path;

    if (is_excluded_entry(rel)) {
        ++ctx.result.entries_excluded;
        return true;
    }

    fs::path target = ctx.working_dir / rel;
    auto parent = ensure_parent_directory(target.string());
    if (!parent.ok) {
        return fail(ctx, parent.error);
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) {
        if (is_data_readers_entry(rel)) {
            return merge_data_readers(ctx, target, rel, write_content);
        }
        // First writer wins
        ++ctx.result.conflicts_dropped;
        if (ctx.options.observer) {
            ctx.options.observer->on_conflict_dropped(rel, ctx.source_path);
        }
        return true;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(ctx, "failed to create " + target.string());
    }
    auto copied = write_content(out);
    if (!copied.ok) {
        return fail(ctx, ctx.source_path + ": " + copied.error);
    }
    out.close();
    if (!out) {
        return fail(ctx, "failed to write " + target.string());
    }

    auto touched = set_last_modified(target.string(), mtime);
    if (!touched.ok) {
        return fail(ctx, touched.error);
    }

    ++ctx.result.files_written;
    return true;
}

FileResult copy_stream(std::istream& in, std::ostream& out, std::vector<char>& buffer) {
    FileResult result;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            out.write(buffer.data(), got);
        }
    }
    if (in.bad()) {
        result.error = "read failed";
        return result;
    }
    if (!out) {
        result.error = "write failed";
        return result;
    }
    result.ok = true;
    return result;
}

bool explode_archive(ExplodeContext& ctx) {
    ZipReader reader(ctx.source_path);
    auto opened = reader.open();
    if (!opened.ok) {
        return fail(ctx, opened.error);
    }

    for (const auto& entry : reader.entries()) {
        if (entry.is_directory()) {
            auto validation = validate_entry_path(entry.name);
            if (!validation.safe) {
                return fail(ctx, "unsafe entry in " + ctx.source_path + ": " + validation.error);
            }
            if (!ensure_directory(ctx, validation.normalized_path)) {
                return false;
            }
            continue;
        }

        ContentWriter write_content = [&](std::ostream& out) {
            auto read = reader.read_entry(entry, out, ctx.buffer);
            return FileResult{read.ok, read.error};
        };
        if (!place_file(ctx, entry.name, entry.last_modified(), write_content)) {
            return false;
        }
    }
    return true;
}

bool explode_directory(ExplodeContext& ctx) {
    fs::path root(ctx.source_path);
    std::error_code ec;

    // Symlinked directories are walked like the directories they point to
    fs::recursive_directory_iterator it(root, fs::directory_options::follow_directory_symlink, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        std::string rel = to_portable_path(path.lexically_relative(root).generic_string());

        std::error_code status_ec;
        if (it->is_directory(status_ec)) {
            if (!ensure_directory(ctx, rel)) {
                return false;
            }
            continue;
        }
        if (!it->is_regular_file(status_ec)) {
            return fail(ctx, "unsupported file type in " + ctx.source_path + ": " + rel);
        }

        auto mtime = get_last_modified(path.string());
        if (!mtime) {
            return fail(ctx, "failed to stat " + path.string());
        }

        ContentWriter write_content = [&](std::ostream& out) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return FileResult{false, "failed to open " + path.string()};
            }
            return copy_stream(in, out, ctx.buffer);
        };
        if (!place_file(ctx, rel, *mtime, write_content)) {
            return false;
        }
    }

    if (ec) {
        return fail(ctx, "failed to walk " + ctx.source_path + ": " + ec.message());
    }
    return true;
}

} // namespace

ExtractResult explode(const std::string& source_path,
                      const std::string& working_dir,
                      const ExtractOptions& options) {
    ExtractResult result;

    ExplodeContext ctx{fs::path(working_dir), source_path, options, result,
                       std::vector<char>(options.buffer_size < 2 ? ZIP_COPY_BUFFER_SIZE
                                                                 : options.buffer_size)};

    std::error_code ec;
    auto status = fs::status(source_path, ec);
    if (ec || !fs::exists(status)) {
        result.error = "source not found: " + source_path;
        return result;
    }

    bool ok = false;
    if (fs::is_directory(status)) {
        ok = explode_directory(ctx);
    } else if (fs::is_regular_file(status)) {
        ok = explode_archive(ctx);
    } else {
        result.error = "unsupported source type: " + source_path;
        return result;
    }

    result.ok = ok;
    return result;
}

} // namespace uberpack
