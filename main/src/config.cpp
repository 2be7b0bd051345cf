#include "config.hpp"

#include <filesystem>

namespace fs = std::filesystem;

#ifndef ARCPACK_L10N_DIR
#define ARCPACK_L10N_DIR "/usr/share/arcpack/l10n/"
#endif

fs::path L10N_DIR = ARCPACK_L10N_DIR;

void set_l10n_dir(const std::string& l10n_dir) {
    L10N_DIR = fs::path(l10n_dir).lexically_normal();
    if (L10N_DIR.empty()) L10N_DIR = ARCPACK_L10N_DIR;
}

void reset_config() {
    L10N_DIR = ARCPACK_L10N_DIR;
}
