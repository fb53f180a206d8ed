#pragma once

#include "core/poco_config_manager.hpp"
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Typed worker settings with the defaults used when a key is absent
 */
struct WorkerSettings
{
    std::string log_level = "INFO";

    std::string database_path = "video_converter.db";
    int database_busy_timeout_ms = 5000;

    // Empty disables the source path containment check
    std::string allowed_root;

    std::string chunk_extension = ".chunk";
    std::string merged_file_name = "merged.mp4";
    size_t merge_buffer_size = 64 * 1024;
    bool reject_unnumbered_chunks = false;

    std::string transcoder_binary = "ffmpeg";
    std::string output_dir_name = "mpeg-dash";
    std::string manifest_name = "output.mpd";
    std::string output_format = "dash";
    bool overwrite_output = true;
    int transcoder_timeout_seconds = 0;
    size_t max_output_bytes = 64 * 1024;

    bool reprocess_on_lookup_failure = false;
};

/**
 * @brief Reads WorkerSettings out of a PocoConfigManager and validates them
 */
class WorkerConfig
{
public:
    /**
     * @brief Build settings from configuration, falling back to defaults per key
     * @param config Loaded configuration
     * @param settings Receives the settings on success
     * @param errors Receives one message per invalid value
     * @return true if every value was readable and valid
     */
    static bool load(const PocoConfigManager &config, WorkerSettings &settings,
                     std::vector<std::string> &errors);

    /**
     * @brief Check cross-field constraints on already populated settings
     * @return One message per violated constraint, empty when valid
     */
    static std::vector<std::string> validate(const WorkerSettings &settings);
};
