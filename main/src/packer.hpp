#pragma once

#include "archive.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Name an input is stored under: its last path component, never a directory prefix.
std::string entry_name_for(const std::filesystem::path& input);

/**
 * Write every path in `inputs` into `<output_base>.zip` or `<output_base>.tar.gz`.
 *
 * - Entries are named by base name only.
 * - tar stores directories recursively and keeps symlinks as links.
 * - zip stores a directory as a single empty entry and follows symlinks.
 * - A missing or unreadable input throws ArcpackException; the partially
 *   written archive is left on disk.
 *
 * Returns the path of the written archive.
 */
std::filesystem::path pack_files(ArchiveFormat format, const std::string& output_base, const std::vector<std::string>& inputs);
