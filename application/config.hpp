#ifndef PROTECT_APPLICATION_CONFIG_HPP
#define PROTECT_APPLICATION_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "service/protect_service.hpp"

namespace application {

    inline nlohmann::json get_json_config(const std::string &name) {
        const std::string config_name = "protect." + (name.empty() ? std::string("default") : name) + ".json";
        std::filesystem::path app_dir = APPLICATION_DIR;
        auto protect_dir = app_dir.parent_path();
        auto conf_dir = protect_dir / "config";
        auto conf_file_path = conf_dir / config_name;
        if (!std::filesystem::exists(conf_file_path)) {
            throw std::runtime_error("Couldn't find config file at path: " + conf_file_path.string());
        }

        std::ifstream config_file(conf_file_path);
        nlohmann::json config;
        config_file >> config;
        return config;
    }

    inline std::string env_or(const char *variable, const std::string &fallback) {
        const char *value = std::getenv(variable);
        return value != nullptr && *value != '\0' ? std::string(value) : fallback;
    }

    inline service::ProtectClientConfig to_client_config(const nlohmann::json &config) {
        return {
            env_or("PROTECT_HOST", config.value("host", "192.168.1.1")),
            env_or("PROTECT_API_KEY", config.value("apiKey", "")),
            config.value("requestTimeoutSeconds", 10),
            config.value("asioPoolSize", 1),
            config.value("verbose", false)
        };
    }

}

#endif //PROTECT_APPLICATION_CONFIG_HPP
