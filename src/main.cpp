#include "core/error_reporter.hpp"
#include "core/idempotency_store.hpp"
#include "core/poco_config_manager.hpp"
#include "core/task_orchestrator.hpp"
#include "core/transcoder.hpp"
#include "core/worker_config.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitTaskFailed = 1;
    constexpr int kExitUsage = 2;

    void printUsage(const char *program)
    {
        std::cout << "Video Converter Worker - merges chunk uploads and converts them to DASH" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>     Configuration file (default: config.json)" << std::endl;
        std::cout << "  --messages, -m <file>   Newline-delimited task messages (default: stdin)" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    bool isBlank(const std::string &line)
    {
        return line.find_first_not_of(" \t\r") == std::string::npos;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    bool config_given = false;
    std::string messages_path;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitOk;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a file argument" << std::endl;
                return kExitUsage;
            }
            config_path = argv[++i];
            config_given = true;
        }
        else if (arg == "--messages" || arg == "-m")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a file argument" << std::endl;
                return kExitUsage;
            }
            messages_path = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            std::cerr << "Use --help or -h for more options." << std::endl;
            return kExitUsage;
        }
    }

    PocoConfigManager config_manager;
    if (config_given || std::filesystem::exists(config_path))
    {
        if (!config_manager.load(config_path))
        {
            Logger::error("Failed to load configuration from " + config_path);
            return kExitUsage;
        }
    }
    else
    {
        Logger::warn("Configuration file " + config_path + " not found, using defaults");
    }

    WorkerSettings settings;
    std::vector<std::string> config_errors;
    if (!WorkerConfig::load(config_manager, settings, config_errors))
    {
        for (const auto &err : config_errors)
            Logger::error("Invalid configuration: " + err);
        return kExitUsage;
    }

    Logger::init(settings.log_level);
    Logger::info("Starting video converter worker (database: " + settings.database_path + ")");

    DatabaseManager db_manager(settings.database_path, settings.database_busy_timeout_ms);
    if (!db_manager.isValid())
    {
        Logger::error("Database is not usable: " + settings.database_path);
        return kExitUsage;
    }

    SqliteIdempotencyStore idempotency_store(db_manager);
    SqliteErrorLogStore error_log_store(db_manager);
    ErrorReporter reporter(error_log_store);

    FfmpegTranscoder::Options transcoder_options;
    transcoder_options.binary = settings.transcoder_binary;
    transcoder_options.format = settings.output_format;
    transcoder_options.manifest_name = settings.manifest_name;
    transcoder_options.overwrite_output = settings.overwrite_output;
    transcoder_options.timeout_seconds = settings.transcoder_timeout_seconds;
    transcoder_options.max_output_bytes = settings.max_output_bytes;
    FfmpegTranscoder transcoder(transcoder_options);

    TaskOrchestrator orchestrator(settings, idempotency_store, transcoder, reporter);

    std::ifstream messages_file;
    if (!messages_path.empty())
    {
        messages_file.open(messages_path);
        if (!messages_file.is_open())
        {
            Logger::error("Failed to open messages file: " + messages_path);
            return kExitUsage;
        }
    }
    std::istream &input = messages_path.empty() ? std::cin : messages_file;

    size_t total = 0;
    size_t failed = 0;
    std::string line;
    while (std::getline(input, line))
    {
        if (isBlank(line))
            continue;
        ++total;

        auto start = std::chrono::steady_clock::now();
        TaskOutcome outcome = orchestrator.handle(line);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

        if (!outcome.completed())
        {
            ++failed;
            Logger::warn("Task failed in " + std::to_string(elapsed) + " ms kind=" +
                         pipelineErrorKindName(outcome.error.kind));
        }
        else
        {
            Logger::debug("Task completed in " + std::to_string(elapsed) + " ms");
        }
    }

    db_manager.waitForWrites();
    Logger::info("Processed " + std::to_string(total) + " messages, " + std::to_string(failed) + " failed");
    return failed == 0 ? kExitOk : kExitTaskFailed;
}
