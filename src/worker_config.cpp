#include "core/worker_config.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>

namespace
{
    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool isPlainFileName(const std::string &name)
    {
        return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
    }
}

bool WorkerConfig::load(const PocoConfigManager &config, WorkerSettings &settings,
                        std::vector<std::string> &errors)
{
    WorkerSettings loaded;
    try
    {
        loaded.log_level = config.getString("log_level", loaded.log_level);

        loaded.database_path = config.getString("database.path", loaded.database_path);
        loaded.database_busy_timeout_ms = config.getInt("database.busy_timeout_ms", loaded.database_busy_timeout_ms);

        loaded.allowed_root = config.getString("worker.allowed_root", loaded.allowed_root);

        loaded.chunk_extension = config.getString("merge.chunk_extension", loaded.chunk_extension);
        loaded.merged_file_name = config.getString("merge.merged_file_name", loaded.merged_file_name);
        int buffer_size = config.getInt("merge.buffer_size_bytes", static_cast<int>(loaded.merge_buffer_size));
        if (buffer_size <= 0)
            errors.push_back("merge.buffer_size_bytes must be positive");
        else
            loaded.merge_buffer_size = static_cast<size_t>(buffer_size);
        loaded.reject_unnumbered_chunks = config.getBool("merge.reject_unnumbered_chunks", loaded.reject_unnumbered_chunks);

        loaded.transcoder_binary = config.getString("transcoder.binary", loaded.transcoder_binary);
        loaded.output_dir_name = config.getString("transcoder.output_dir_name", loaded.output_dir_name);
        loaded.manifest_name = config.getString("transcoder.manifest_name", loaded.manifest_name);
        loaded.output_format = config.getString("transcoder.format", loaded.output_format);
        loaded.overwrite_output = config.getBool("transcoder.overwrite_output", loaded.overwrite_output);
        loaded.transcoder_timeout_seconds = config.getInt("transcoder.timeout_seconds", loaded.transcoder_timeout_seconds);
        int max_output = config.getInt("transcoder.max_output_bytes", static_cast<int>(loaded.max_output_bytes));
        if (max_output <= 0)
            errors.push_back("transcoder.max_output_bytes must be positive");
        else
            loaded.max_output_bytes = static_cast<size_t>(max_output);

        loaded.reprocess_on_lookup_failure = config.getBool("idempotency.reprocess_on_lookup_failure",
                                                            loaded.reprocess_on_lookup_failure);
    }
    catch (const Poco::Exception &e)
    {
        errors.push_back("Unreadable configuration value: " + e.displayText());
        return false;
    }

    auto validation_errors = validate(loaded);
    errors.insert(errors.end(), validation_errors.begin(), validation_errors.end());
    if (!errors.empty())
        return false;

    settings = loaded;
    return true;
}

std::vector<std::string> WorkerConfig::validate(const WorkerSettings &settings)
{
    std::vector<std::string> errors;

    if (!Logger::isValidLevel(settings.log_level))
        errors.push_back("log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");
    if (settings.database_path.empty())
        errors.push_back("database.path must not be empty");
    if (settings.database_busy_timeout_ms < 0)
        errors.push_back("database.busy_timeout_ms must not be negative");

    if (settings.chunk_extension.empty() || settings.chunk_extension.find('/') != std::string::npos)
        errors.push_back("merge.chunk_extension must be a non-empty file suffix");
    if (!isPlainFileName(settings.merged_file_name))
        errors.push_back("merge.merged_file_name must be a plain file name");
    else if (!settings.chunk_extension.empty() && endsWith(settings.merged_file_name, settings.chunk_extension))
        errors.push_back("merge.merged_file_name must not end with the chunk extension");
    if (settings.merge_buffer_size == 0)
        errors.push_back("merge.buffer_size_bytes must be positive");

    if (settings.transcoder_binary.empty())
        errors.push_back("transcoder.binary must not be empty");
    if (!isPlainFileName(settings.output_dir_name))
        errors.push_back("transcoder.output_dir_name must be a plain directory name");
    if (!isPlainFileName(settings.manifest_name))
        errors.push_back("transcoder.manifest_name must be a plain file name");
    if (settings.output_format.empty())
        errors.push_back("transcoder.format must not be empty");
    if (settings.transcoder_timeout_seconds < 0)
        errors.push_back("transcoder.timeout_seconds must not be negative");
    if (settings.max_output_bytes == 0)
        errors.push_back("transcoder.max_output_bytes must be positive");

    return errors;
}
