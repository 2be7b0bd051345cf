#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>

namespace fs = std::filesystem;

namespace {
    void check_setup(struct archive* a, int r, const fs::path& output_path) {
        if (r == ARCHIVE_WARN) {
            log_warning(archive_error_message(a));
        } else if (r < ARCHIVE_WARN) {
            throw ArcpackException(string_format("error.archive_setup_failed", output_path.string()) + ": " + archive_error_message(a));
        }
    }
}

std::string archive_error_message(struct archive* a) {
    const char* err = archive_error_string(a);
    return err ? err : get_string("error.unknown");
}

std::optional<ArchiveFormat> parse_archive_format(std::string_view name) {
    const std::string lowered = to_lower(name);
    if (lowered == "zip") return ArchiveFormat::ZIP;
    if (lowered == "tar") return ArchiveFormat::TAR_GZ;
    return std::nullopt;
}

std::string_view archive_extension(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP:
            return ".zip";
        case ArchiveFormat::TAR_GZ:
            return ".tar.gz";
    }
    throw ArcpackException(string_format("error.unknown_format", static_cast<int>(format)));
}

void ArchiveWriteDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_write_close(a);
        archive_write_free(a);
    }
}

ArchiveWriteHandle open_archive_writer(ArchiveFormat format, const fs::path& output_path) {
    ArchiveWriteHandle a(archive_write_new());
    if (!a) {
        throw ArcpackException(string_format("error.archive_setup_failed", output_path.string()));
    }

    if (format == ArchiveFormat::ZIP) {
        check_setup(a.get(), archive_write_set_format_zip(a.get()), output_path);
        check_setup(a.get(), archive_write_set_format_option(a.get(), "zip", "compression", "deflate"), output_path);
        // A zip central directory must be the last thing in the file
        check_setup(a.get(), archive_write_set_bytes_in_last_block(a.get(), 1), output_path);
    } else {
        check_setup(a.get(), archive_write_add_filter_gzip(a.get()), output_path);
        check_setup(a.get(), archive_write_set_format_pax_restricted(a.get()), output_path);
    }

    if (archive_write_open_filename(a.get(), output_path.c_str()) != ARCHIVE_OK) {
        throw ArcpackException(string_format("error.open_output_failed", output_path.string()) + ": " + archive_error_message(a.get()));
    }
    return a;
}

void close_archive_writer(ArchiveWriteHandle& handle, const fs::path& output_path) {
    if (!handle) return;
    int r = archive_write_close(handle.get());
    std::string err = r < ARCHIVE_OK ? archive_error_message(handle.get()) : std::string();
    archive_write_free(handle.release());
    if (r < ARCHIVE_WARN) {
        throw ArcpackException(string_format("error.close_output_failed", output_path.string()) + ": " + err);
    }
    if (r == ARCHIVE_WARN) {
        log_warning(err);
    }
}
