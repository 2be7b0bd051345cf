#pragma once

#include <string>
#include <filesystem>

// Directory holding the <lang>.txt message tables
extern std::filesystem::path L10N_DIR;

// Functions
void set_l10n_dir(const std::string& l10n_dir);
void reset_config();
