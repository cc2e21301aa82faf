#include <cratebox/archive.hpp>
#include <cratebox/log.hpp>

#include <memory>

extern "C" {
#include <archive.h>
#include <archive_entry.h>
}

namespace fs = std::filesystem;

namespace cratebox {

namespace {

constexpr size_t kArchiveBlockSize = 10240;

void archive_read_closer(archive* a_in) {
    if (a_in != nullptr) {
        archive_read_close(a_in);
        archive_read_free(a_in);
    }
}

void archive_write_closer(archive* a_out) {
    if (a_out != nullptr) {
        archive_write_close(a_out);
        archive_write_free(a_out);
    }
}

CrateboxError archive_error(archive* a, const std::string& what) {
    const char* detail = archive_error_string(a);
    return CrateboxError{CrateboxError::Archive,
        what + ": " + (detail ? detail : "unknown libarchive error")};
}

bool escapes_root(const fs::path& rel) {
    if (rel.is_absolute() || rel.has_root_name()) return true;
    for (const auto& part : rel) {
        if (part == "..") return true;
    }
    return false;
}

Status copy_data(archive* ar, archive* aw) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        int r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return ok_status();
        }
        if (r != ARCHIVE_OK) {
            return archive_error(ar, "cannot read archive data");
        }
        if (archive_write_data_block(aw, buff, size, offset) != ARCHIVE_OK) {
            return archive_error(aw, "cannot write archive data");
        }
    }
}

} // namespace

std::string strip_first_component(const std::string& entry_path) {
    size_t start = 0;
    // "./foo-1.0.0/..." is the same entry as "foo-1.0.0/..."
    while (entry_path.compare(start, 2, "./") == 0) start += 2;
    while (start < entry_path.size() && entry_path[start] == '/') ++start;

    auto slash = entry_path.find('/', start);
    if (slash == std::string::npos) return "";
    auto rest = entry_path.find_first_not_of('/', slash);
    if (rest == std::string::npos) return "";
    return entry_path.substr(rest);
}

Status unpack_without_first_dir(const fs::path& archive_path, const fs::path& dest_dir) {
    std::unique_ptr<archive, decltype(&archive_read_closer)> a_in{
        archive_read_new(), archive_read_closer};
    if (!a_in) {
        return CrateboxError{CrateboxError::Archive, "archive_read_new failed"};
    }
    archive_read_support_filter_all(a_in.get());
    archive_read_support_format_tar(a_in.get());

    if (archive_read_open_filename(a_in.get(), archive_path.c_str(),
                                   kArchiveBlockSize) != ARCHIVE_OK) {
        auto err = archive_error(a_in.get(), "cannot open archive");
        err.path = archive_path.string();
        return err;
    }

    std::unique_ptr<archive, decltype(&archive_write_closer)> disk{
        archive_write_disk_new(), archive_write_closer};
    if (!disk) {
        return CrateboxError{CrateboxError::Archive, "archive_write_disk_new failed"};
    }
    // Registry archives are untrusted: no ".." and no writing through a
    // symlink the archive itself planted
    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(disk.get(), flags);
    archive_write_disk_set_standard_lookup(disk.get());

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create destination directory: " + ec.message(), dest_dir.string());
    }
    // libarchive refuses ".." and symlinks anywhere in the written path,
    // including the part naming `dest_dir` itself
    fs::path dest = fs::weakly_canonical(dest_dir, ec);
    if (ec) dest = fs::absolute(dest_dir, ec).lexically_normal();

    archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(a_in.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return archive_error(a_in.get(), "cannot read archive entry");
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string rel = strip_first_component(raw_name ? raw_name : "");
        if (rel.empty()) continue;

        fs::path rel_path(rel);
        if (escapes_root(rel_path)) {
            return CrateboxError::at(CrateboxError::Archive,
                "archive entry escapes the destination", rel);
        }

        // Missing parents are created by libarchive, which checks them for
        // symlinks; std::filesystem would follow them
        fs::path full_path = dest / rel_path;
        archive_entry_set_pathname(entry, full_path.c_str());

        // Hard links name another entry of the same archive
        if (const char* link = archive_entry_hardlink(entry)) {
            std::string link_rel = strip_first_component(link);
            if (link_rel.empty() || escapes_root(fs::path(link_rel))) {
                return CrateboxError::at(CrateboxError::Archive,
                    "archive hard link escapes the destination", link);
            }
            archive_entry_set_hardlink(entry, (dest / link_rel).c_str());
        }

        if (archive_write_header(disk.get(), entry) != ARCHIVE_OK) {
            auto err = archive_error(disk.get(), "cannot unpack entry");
            err.path = full_path.string();
            return err;
        }
        if (archive_entry_size(entry) > 0) {
            CRATEBOX_TRY(copy_data(a_in.get(), disk.get()));
        }
        if (archive_write_finish_entry(disk.get()) != ARCHIVE_OK) {
            auto err = archive_error(disk.get(), "cannot finish entry");
            err.path = full_path.string();
            return err;
        }
        log::trace("unpacked %s", full_path.c_str());
    }

    return ok_status();
}

} // namespace cratebox
