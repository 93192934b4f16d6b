#include <nodule/archive.hpp>
#include <nodule/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace nodule {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

static NoduleError archive_error(struct archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    return NoduleError{NoduleError::Extract,
        what + ": " + (msg ? msg : "unknown archive error")};
}

Result<std::string> strip_member_path(const std::string& member, int n) {
    if (!member.empty() && member[0] == '/') {
        return NoduleError{NoduleError::Extract,
            "archive member has an absolute path: " + member};
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= member.size()) {
        size_t slash = member.find('/', start);
        std::string seg = member.substr(start, slash == std::string::npos
                                                   ? std::string::npos
                                                   : slash - start);
        if (seg == "..") {
            return NoduleError{NoduleError::Extract,
                "archive member escapes the target directory: " + member};
        }
        if (!seg.empty() && seg != ".") parts.push_back(seg);
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    std::string out;
    for (size_t i = static_cast<size_t>(n); i < parts.size(); ++i) {
        if (!out.empty()) out += '/';
        out += parts[i];
    }
    return Result<std::string>::ok(std::move(out));
}

TarGzExtractor::TarGzExtractor(int strip_components)
    : strip_components_(strip_components) {}

Status TarGzExtractor::extract(const std::string& bytes, const fs::path& dest) {
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return NoduleError{NoduleError::Extract,
            "cannot create " + dest.string() + ": " + ec.message()};
    }
    // Symlinked ancestors would trip ARCHIVE_EXTRACT_SECURE_SYMLINKS
    fs::path root = fs::canonical(dest, ec);
    if (ec) {
        return NoduleError{NoduleError::Extract,
            "cannot resolve " + dest.string() + ": " + ec.message()};
    }

    ArchiveReadHandle in(archive_read_new());
    archive_read_support_filter_gzip(in.get());
    archive_read_support_format_tar(in.get());
    archive_read_support_format_gnutar(in.get());

    ArchiveWriteHandle out(archive_write_disk_new());
    archive_write_disk_set_options(out.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(out.get());

    if (archive_read_open_memory(in.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return archive_error(in.get(), "cannot open archive");
    }

    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    long long count = 0;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK) {
        const char* raw = archive_entry_pathname(entry);
        auto rel = strip_member_path(raw ? raw : "", strip_components_);
        if (rel.is_err()) return std::move(rel).error();
        if (rel.value().empty()) continue;

        // Member paths are rewritten under dest, so absolute-path checks
        // happen in strip_member_path rather than in libarchive
        std::string target = (root / rel.value()).string();
        archive_entry_set_pathname(entry, target.c_str());

        const char* link = archive_entry_hardlink(entry);
        if (link) {
            auto link_rel = strip_member_path(link, strip_components_);
            if (link_rel.is_err()) return std::move(link_rel).error();
            std::string link_target = (root / link_rel.value()).string();
            archive_entry_set_hardlink(entry, link_target.c_str());
        }

        if (archive_write_header(out.get(), entry) < ARCHIVE_OK) {
            return archive_error(out.get(), "cannot write " + target);
        }

        const void* buff;
        size_t size;
        la_int64_t offset;
        while ((r = archive_read_data_block(in.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(out.get(), buff, size, offset) < ARCHIVE_OK) {
                return archive_error(out.get(), "cannot write " + target);
            }
        }
        if (r != ARCHIVE_EOF) {
            return archive_error(in.get(), "corrupt archive member " + rel.value());
        }

        if (archive_write_finish_entry(out.get()) < ARCHIVE_OK) {
            return archive_error(out.get(), "cannot finish " + target);
        }
        ++count;
    }

    if (r != ARCHIVE_EOF) {
        return archive_error(in.get(), "malformed archive");
    }

    log::debug("extracted %lld entries into %s", count, dest.string().c_str());
    return ok_status();
}

} // namespace nodule
