#include "core/transcoder.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

FfmpegTranscoder::FfmpegTranscoder(Options options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      runner_(options_.max_output_bytes, std::chrono::seconds(options_.timeout_seconds)),
      logger_(logger ? std::move(logger) : Logger::get())
{
}

std::vector<std::string> FfmpegTranscoder::buildCommand(const std::string &input_file,
                                                        const std::string &manifest_path) const
{
    std::vector<std::string> command = {options_.binary};
    if (options_.overwrite_output)
        command.push_back("-y");
    command.insert(command.end(), {"-i", input_file, "-f", options_.format, manifest_path});
    return command;
}

TranscodeResult FfmpegTranscoder::encode(const std::string &input_file, const std::string &output_dir)
{
    TranscodeResult result;

    logger_->info("Creating output dir path={}", output_dir);
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec)
    {
        result.status = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                             "failed to create " + options_.format + " directory",
                                             output_dir + ": " + ec.message());
        return result;
    }

    result.manifest_path = (fs::path(output_dir) / options_.manifest_name).string();
    logger_->info("Converting video to {} input={} manifest={}", options_.format, input_file, result.manifest_path);

    ProcessResult process = runner_.run(buildCommand(input_file, result.manifest_path));
    result.output = ProcessRunner::describeOutput(process);

    if (!process.launched)
    {
        result.status = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                             "failed to launch " + options_.binary,
                                             process.error_message);
        return result;
    }
    if (process.timed_out)
    {
        result.status = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                             "transcoder timed out after " + std::to_string(options_.timeout_seconds) + "s, output: " + result.output,
                                             result.output);
        return result;
    }
    if (process.term_signal != 0)
    {
        result.status = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                             "transcoder killed by signal " + std::to_string(process.term_signal) + ", output: " + result.output,
                                             result.output);
        return result;
    }
    if (process.exit_code != 0)
    {
        result.status = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                             "failed to convert video to " + options_.format + " (exit code " +
                                                 std::to_string(process.exit_code) + "), output: " + result.output,
                                             result.output);
        return result;
    }

    logger_->info("Video converted to {} path={}", options_.format, output_dir);
    result.status = StageResult::Ok();
    return result;
}
