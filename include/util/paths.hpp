#pragma once

#include <filesystem>

namespace fdrop::paths {

// Engine configuration (YAML). Honors $FASTDROP_CONFIG, then $XDG_CONFIG_HOME.
std::filesystem::path getConfigPath();

// Persisted settings record (credentials and flags).
std::filesystem::path getStatePath();

std::filesystem::path getLogDir();

std::filesystem::path getHomeDir();

// Absolute and lexically normalised ("a.txt", "./a.txt" and "$PWD/a.txt" agree).
// Does not touch the filesystem, so the file need not exist.
std::filesystem::path absoluteNormal(const std::filesystem::path& path);

void setLogPathForTesting();

}
