#include "util/paths.hpp"

#include <cstdlib>
#include <optional>
#include <pwd.h>
#include <unistd.h>

namespace fdrop::paths {

namespace {
std::optional<std::filesystem::path> logDirOverride;

std::optional<std::filesystem::path> fromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::filesystem::path(value);
}
}

std::filesystem::path getHomeDir() {
    if (const auto home = fromEnv("HOME")) return *home;
    if (const auto* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return std::filesystem::temp_directory_path();
}

std::filesystem::path getConfigPath() {
    if (const auto explicitPath = fromEnv("FASTDROP_CONFIG")) return *explicitPath;
    if (const auto xdg = fromEnv("XDG_CONFIG_HOME")) return *xdg / "fastdrop" / "config.yaml";
    return getHomeDir() / ".config" / "fastdrop" / "config.yaml";
}

std::filesystem::path getStatePath() {
    return getHomeDir() / ".fastdrop" / "config.json";
}

std::filesystem::path getLogDir() {
    if (logDirOverride) return *logDirOverride;
    return getHomeDir() / ".fastdrop" / "logs";
}

std::filesystem::path absoluteNormal(const std::filesystem::path& path) {
    return std::filesystem::absolute(path).lexically_normal();
}

void setLogPathForTesting() {
    logDirOverride = std::filesystem::temp_directory_path() / "fastdrop_test_logs";
}

}
