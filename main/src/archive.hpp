#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct archive;

enum class ArchiveFormat {
    ZIP,
    TAR_GZ
};

// Case-insensitive: "zip" or "tar"
std::optional<ArchiveFormat> parse_archive_format(std::string_view name);
std::string_view archive_extension(ArchiveFormat format);

// Custom deleter for libarchive write handles
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const;
};

using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

// libarchive's last error for `a`, never null
std::string archive_error_message(struct archive* a);

ArchiveWriteHandle open_archive_writer(ArchiveFormat format, const std::filesystem::path& output_path);
void close_archive_writer(ArchiveWriteHandle& handle, const std::filesystem::path& output_path);
