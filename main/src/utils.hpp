#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Per-entry logging while packing
void set_verbose_mode(bool enable);
bool get_verbose_mode();

// ASCII lower-casing, used for case-insensitive command matching
std::string to_lower(std::string_view s);
