#include "config.h"
#include "fs.h"
#include "logger.h"
#include <fstream>
#include <sstream>

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace remotefm {

std::string FileManagerConfig::get_base_download_path() const {
    return combine_paths(download_directory, sub_directory);
}

void to_json(nlohmann::json& j, const FileManagerConfig& config) {
    j = nlohmann::json{
        {"download_directory", config.download_directory},
        {"sub_directory", config.sub_directory},
        {"chunk_size", config.chunk_size},
        {"max_concurrent_uploads", config.max_concurrent_uploads}
    };
}

void from_json(const nlohmann::json& j, FileManagerConfig& config) {
    config.download_directory = j.value("download_directory", config.download_directory);
    config.sub_directory = j.value("sub_directory", config.sub_directory);
    config.chunk_size = j.value("chunk_size", config.chunk_size);
    config.max_concurrent_uploads = j.value("max_concurrent_uploads", config.max_concurrent_uploads);
}

bool load_config_file(const std::string& path, FileManagerConfig& config) {
    if (!file_exists(path)) {
        LOG_CONFIG_WARN("Configuration file not found: " << path);
        return false;
    }

    std::ifstream in(path);
    if (!in) {
        LOG_CONFIG_ERROR("Failed to open configuration file: " << path);
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            LOG_CONFIG_ERROR("Configuration in " << path << " is not a JSON object");
            return false;
        }

        FileManagerConfig loaded = config;
        j.get_to(loaded);

        if (loaded.chunk_size == 0 || loaded.max_concurrent_uploads == 0) {
            LOG_CONFIG_ERROR("chunk_size and max_concurrent_uploads must be positive in " << path);
            return false;
        }

        config = loaded;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration " << path << ": " << e.what());
        return false;
    }

    LOG_CONFIG_INFO("Loaded configuration from " << path);
    return true;
}

bool save_config_file(const std::string& path, const FileManagerConfig& config) {
    nlohmann::json j = config;
    std::string data = j.dump(4);
    if (!create_file(path, data)) {
        LOG_CONFIG_ERROR("Failed to write configuration file: " << path);
        return false;
    }
    return true;
}

} // namespace remotefm
