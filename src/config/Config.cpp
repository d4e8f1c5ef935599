#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <yaml-cpp/yaml.h>

namespace fdrop::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());
    if (!root || root.IsNull()) return cfg;

    if (auto node = root["uploads"]) YAML::convert<UploadsConfig>::decode(node, cfg.uploads);
    if (auto node = root["anonymous_host"]) YAML::convert<AnonymousHostConfig>::decode(node, cfg.anonymous_host);
    if (auto node = root["cloud_store"]) YAML::convert<CloudStoreConfig>::decode(node, cfg.cloud_store);
    if (auto node = root["state"]) YAML::convert<StateConfig>::decode(node, cfg.state);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::filesystem::path Config::statePath() const {
    return state.path.empty() ? paths::getStatePath() : state.path;
}

std::filesystem::path Config::logDir() const {
    return logging.log_dir.empty() ? paths::getLogDir() : logging.log_dir;
}

std::string Config::dump() const {
    YAML::Node root;
    root["uploads"] = uploads;
    root["anonymous_host"] = anonymous_host;
    root["cloud_store"] = cloud_store;
    root["state"] = StateConfig{statePath()};
    root["logging"] = LoggingConfig{logDir(), logging.levels};

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
