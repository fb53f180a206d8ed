#pragma once

#include "core/processing_result.hpp"
#include "core/process_runner.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

/**
 * @brief Result of one transcoder invocation
 */
struct TranscodeResult
{
    StageResult status;
    std::string manifest_path;
    // Combined stdout/stderr of the encoder, bounded
    std::string output;
};

/**
 * @brief Converts a merged artifact into streaming output
 */
class Transcoder
{
public:
    virtual ~Transcoder() = default;

    /**
     * @brief Encode input_file into output_dir, creating output_dir if needed
     */
    virtual TranscodeResult encode(const std::string &input_file, const std::string &output_dir) = 0;
};

/**
 * @brief Transcoder backed by an ffmpeg child process
 *
 * Runs `<binary> -i <input> -f <format> <output_dir>/<manifest>` and treats a zero
 * exit code as success. Partial output is left in place on failure.
 */
class FfmpegTranscoder : public Transcoder
{
public:
    struct Options
    {
        std::string binary = "ffmpeg";
        std::string format = "dash";
        std::string manifest_name = "output.mpd";
        bool overwrite_output = true;
        int timeout_seconds = 0;
        size_t max_output_bytes = 64 * 1024;
    };

    explicit FfmpegTranscoder(Options options, std::shared_ptr<spdlog::logger> logger = nullptr);

    TranscodeResult encode(const std::string &input_file, const std::string &output_dir) override;

    std::vector<std::string> buildCommand(const std::string &input_file, const std::string &manifest_path) const;

private:
    Options options_;
    ProcessRunner runner_;
    std::shared_ptr<spdlog::logger> logger_;
};
