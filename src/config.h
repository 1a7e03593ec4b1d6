#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace remotefm {

/**
 * File manager configuration
 */
struct FileManagerConfig {
    std::string download_directory;     // Base directory for downloads (default: "downloads")
    std::string sub_directory;          // Optional per-client folder below download_directory
    uint32_t chunk_size;                // Upload chunk size in bytes (default: 65535)
    uint32_t max_concurrent_uploads;    // Upload admission slots (default: 2)

    FileManagerConfig()
        : download_directory("downloads"),
          sub_directory(""),
          chunk_size(65535),
          max_concurrent_uploads(2) {}

    // download_directory joined with sub_directory
    std::string get_base_download_path() const;
};

void to_json(nlohmann::json& j, const FileManagerConfig& config);

// Absent keys keep their current value
void from_json(const nlohmann::json& j, FileManagerConfig& config);

/**
 * Load configuration from a JSON file on top of the values already in config
 * @return false if the file is missing or malformed; config is left untouched
 */
bool load_config_file(const std::string& path, FileManagerConfig& config);

/**
 * Write configuration as pretty-printed JSON
 */
bool save_config_file(const std::string& path, const FileManagerConfig& config);

} // namespace remotefm
