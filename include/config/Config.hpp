#pragma once

#include "types/ProviderKind.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace fdrop::config {

struct UploadsConfig {
    std::chrono::milliseconds progress_interval{200};
    unsigned int progress_step = 10;
    unsigned int progress_cap = 90;     // synthetic progress never passes this before completion
    types::ProviderKind default_provider = types::ProviderKind::AnonymousHost;
};

struct AnonymousHostConfig {
    std::string endpoint = "https://0x0.st";
    std::string user_agent = "FastDrop/1.0 (File Uploader)";
    std::string form_field = "file";
    long timeout_seconds = 300;
};

struct CloudStoreConfig {
    std::string upload_endpoint = "https://www.googleapis.com/upload/drive/v3/files?uploadType=multipart";
    std::string files_endpoint = "https://www.googleapis.com/drive/v3/files";
    std::string view_url_prefix = "https://drive.google.com/file/d/";
    std::string parent_folder;          // empty: upload to the drive root
    std::string redirect_uri = "urn:ietf:wg:oauth:2.0:oob";
    long timeout_seconds = 300;
};

struct StateConfig {
    std::filesystem::path path;         // empty: paths::getStatePath()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum fastdrop    = spdlog::level::info;   // startup, shutdown, CLI
    spdlog::level::level_enum upload      = spdlog::level::info;   // entry transitions
    spdlog::level::level_enum http        = spdlog::level::warn;   // transport failures
    spdlog::level::level_enum cloud       = spdlog::level::warn;   // provider errors
    spdlog::level::level_enum credentials = spdlog::level::warn;
    spdlog::level::level_enum notify      = spdlog::level::warn;   // clipboard/notification failures
    spdlog::level::level_enum config      = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;      // empty: paths::getLogDir()
    LogLevelsConfig levels;
};

struct Config {
    UploadsConfig uploads;
    AnonymousHostConfig anonymous_host;
    CloudStoreConfig cloud_store;
    StateConfig state;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path statePath() const;
    [[nodiscard]] std::filesystem::path logDir() const;

    // Effective configuration as YAML, defaults included.
    [[nodiscard]] std::string dump() const;
};

// A missing file yields defaults; a malformed one throws.
Config loadConfig(const std::filesystem::path& path);

}
