#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace YAML {

using namespace fdrop::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<UploadsConfig> {
    static Node encode(const UploadsConfig& rhs) {
        Node node;
        node["progress_interval_ms"] = static_cast<long>(rhs.progress_interval.count());
        node["progress_step"] = rhs.progress_step;
        node["progress_cap"] = rhs.progress_cap;
        node["default_provider"] = fdrop::types::to_string(rhs.default_provider);
        return node;
    }

    static bool decode(const Node& node, UploadsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.progress_interval = std::chrono::milliseconds(node["progress_interval_ms"].as<long>(200));
        rhs.progress_step = node["progress_step"].as<unsigned int>(10);
        rhs.progress_cap = node["progress_cap"].as<unsigned int>(90);
        rhs.default_provider = fdrop::types::provider_kind_from_string(
            node["default_provider"].as<std::string>("anonymous"));

        if (rhs.progress_interval.count() <= 0)
            throw std::invalid_argument("uploads.progress_interval_ms must be positive");
        if (rhs.progress_step == 0)
            throw std::invalid_argument("uploads.progress_step must be positive");
        if (rhs.progress_cap >= 100)
            throw std::invalid_argument("uploads.progress_cap must be below 100");
        return true;
    }
};

template<>
struct convert<AnonymousHostConfig> {
    static Node encode(const AnonymousHostConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["user_agent"] = rhs.user_agent;
        node["form_field"] = rhs.form_field;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, AnonymousHostConfig& rhs) {
        if (!node.IsMap()) return false;
        const AnonymousHostConfig defaults;
        rhs.endpoint = node["endpoint"].as<std::string>(defaults.endpoint);
        rhs.user_agent = node["user_agent"].as<std::string>(defaults.user_agent);
        rhs.form_field = node["form_field"].as<std::string>(defaults.form_field);
        rhs.timeout_seconds = node["timeout_seconds"].as<long>(defaults.timeout_seconds);
        return true;
    }
};

template<>
struct convert<CloudStoreConfig> {
    static Node encode(const CloudStoreConfig& rhs) {
        Node node;
        node["upload_endpoint"] = rhs.upload_endpoint;
        node["files_endpoint"] = rhs.files_endpoint;
        node["view_url_prefix"] = rhs.view_url_prefix;
        node["parent_folder"] = rhs.parent_folder;
        node["redirect_uri"] = rhs.redirect_uri;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, CloudStoreConfig& rhs) {
        if (!node.IsMap()) return false;
        const CloudStoreConfig defaults;
        rhs.upload_endpoint = node["upload_endpoint"].as<std::string>(defaults.upload_endpoint);
        rhs.files_endpoint = node["files_endpoint"].as<std::string>(defaults.files_endpoint);
        rhs.view_url_prefix = node["view_url_prefix"].as<std::string>(defaults.view_url_prefix);
        rhs.parent_folder = node["parent_folder"].as<std::string>("");
        rhs.redirect_uri = node["redirect_uri"].as<std::string>(defaults.redirect_uri);
        rhs.timeout_seconds = node["timeout_seconds"].as<long>(defaults.timeout_seconds);
        return true;
    }
};

template<>
struct convert<StateConfig> {
    static Node encode(const StateConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, StateConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["fastdrop"]    = to_std_string(spdlog::level::to_string_view(rhs.fastdrop));
        node["upload"]      = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["http"]        = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["cloud"]       = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["credentials"] = to_std_string(spdlog::level::to_string_view(rhs.credentials));
        node["notify"]      = to_std_string(spdlog::level::to_string_view(rhs.notify));
        node["config"]      = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.fastdrop = spdlog::level::from_str(node["fastdrop"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.credentials = spdlog::level::from_str(node["credentials"].as<std::string>("warn"));
        rhs.notify = spdlog::level::from_str(node["notify"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
