#include "packer.hpp"
#include "utils.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {
    struct ArchiveEntryDeleter {
        void operator()(struct archive_entry* e) const {
            if (e) archive_entry_free(e);
        }
    };

    using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

    struct PackContext {
        struct archive* a = nullptr;
        ArchiveFormat format = ArchiveFormat::ZIP;
        struct stat output_stat {};
        bool has_output_stat = false;
        std::unordered_set<std::string> entry_names;
    };

    void add_to_archive(PackContext& ctx, const fs::path& path, const std::string& entry_name);

    void add_dir_recursive(PackContext& ctx, const fs::path& dir, const std::string& archive_prefix) {
        std::vector<fs::path> children;
        for (const auto& entry : fs::directory_iterator(dir)) {
            children.push_back(entry.path());
        }
        std::sort(children.begin(), children.end());
        for (const auto& child : children) {
            add_to_archive(ctx, child, archive_prefix + "/" + child.filename().string());
        }
    }

    void add_to_archive(PackContext& ctx, const fs::path& path, const std::string& entry_name) {
        const bool is_tar = ctx.format == ArchiveFormat::TAR_GZ;

        // tar keeps links as links, zip stores what they point to
        struct stat st;
        int rc = is_tar ? lstat(path.c_str(), &st) : stat(path.c_str(), &st);
        if (rc != 0) {
            throw ArcpackException(string_format("error.stat_failed", path.string()) + ": " + std::strerror(errno));
        }

        if (ctx.has_output_stat && st.st_dev == ctx.output_stat.st_dev && st.st_ino == ctx.output_stat.st_ino) {
            log_warning(string_format("warning.skip_output_archive", path.string()));
            return;
        }

        if (!is_tar && !S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode)) {
            throw ArcpackException(string_format("error.unsupported_file_type", path.string()));
        }

        std::string name = entry_name;
        if (!is_tar && S_ISDIR(st.st_mode)) {
            name += "/";
        }

        if (!ctx.entry_names.insert(name).second) {
            log_warning(string_format("warning.duplicate_entry", name));
        }

        std::ifstream f;
        if (S_ISREG(st.st_mode)) {
            f.open(path, std::ios::binary);
            if (!f.is_open()) {
                throw ArcpackException(string_format("error.open_file_failed", path.string()) + ": " + std::strerror(errno));
            }
        }

        ArchiveEntryHandle entry(archive_entry_new());
        archive_entry_copy_stat(entry.get(), &st);
        archive_entry_set_pathname(entry.get(), name.c_str());
        if (!S_ISREG(st.st_mode)) {
            archive_entry_set_size(entry.get(), 0);
        }

        if (S_ISLNK(st.st_mode)) {
            std::error_code ec;
            fs::path link_target = fs::read_symlink(path, ec);
            if (ec) {
                throw ArcpackException(string_format("error.readlink_failed", path.string()) + ": " + ec.message());
            }
            archive_entry_set_symlink(entry.get(), link_target.c_str());
        }

        if (get_verbose_mode()) {
            log_info(string_format("info.adding_entry", name));
        }

        int r = archive_write_header(ctx.a, entry.get());
        if (r < ARCHIVE_WARN) {
            throw ArcpackException(string_format("error.write_header_failed", name) + ": " + archive_error_message(ctx.a));
        }
        if (r == ARCHIVE_WARN) {
            log_warning(archive_error_message(ctx.a));
        }

        if (S_ISREG(st.st_mode)) {
            char buffer[8192];
            while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
                if (archive_write_data(ctx.a, buffer, static_cast<size_t>(f.gcount())) < 0) {
                    throw ArcpackException(string_format("error.write_data_failed", name) + ": " + archive_error_message(ctx.a));
                }
            }
            if (f.bad()) {
                throw ArcpackException(string_format("error.read_file_failed", path.string()));
            }
        }

        if (is_tar && S_ISDIR(st.st_mode)) {
            add_dir_recursive(ctx, path, entry_name);
        }
    }
}

std::string entry_name_for(const fs::path& input) {
    fs::path p = input;
    // "dir/" names "dir"
    while (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }

    std::string name = p.filename().string();
    if (name.empty() || name == "." || name == "..") {
        name = fs::weakly_canonical(fs::absolute(input)).filename().string();
    }
    if (name.empty()) {
        throw ArcpackException(string_format("error.invalid_entry_name", input.string()));
    }
    return name;
}

fs::path pack_files(ArchiveFormat format, const std::string& output_base, const std::vector<std::string>& inputs) {
    fs::path output_path = output_base + std::string(archive_extension(format));

    ArchiveWriteHandle handle = open_archive_writer(format, output_path);

    PackContext ctx;
    ctx.a = handle.get();
    ctx.format = format;
    ctx.has_output_stat = stat(output_path.c_str(), &ctx.output_stat) == 0;

    if (get_verbose_mode()) {
        log_info(string_format("info.pack_start", output_path.string(), inputs.size()));
    }

    for (const auto& input : inputs) {
        add_to_archive(ctx, input, entry_name_for(input));
    }

    close_archive_writer(handle, output_path);
    return output_path;
}
