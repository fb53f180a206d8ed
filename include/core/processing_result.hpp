#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Failure taxonomy of the conversion pipeline
 */
enum class PipelineErrorKind
{
    None,
    DecodeError,
    NoChunksFound,
    InvalidChunkName,
    MergeIOError,
    TranscodeError,
    CleanupError,
    StoreError,
    ReportingFailure
};

inline const char *pipelineErrorKindName(PipelineErrorKind kind)
{
    switch (kind)
    {
    case PipelineErrorKind::None:
        return "None";
    case PipelineErrorKind::DecodeError:
        return "DecodeError";
    case PipelineErrorKind::NoChunksFound:
        return "NoChunksFound";
    case PipelineErrorKind::InvalidChunkName:
        return "InvalidChunkName";
    case PipelineErrorKind::MergeIOError:
        return "MergeIOError";
    case PipelineErrorKind::TranscodeError:
        return "TranscodeError";
    case PipelineErrorKind::CleanupError:
        return "CleanupError";
    case PipelineErrorKind::StoreError:
        return "StoreError";
    case PipelineErrorKind::ReportingFailure:
        return "ReportingFailure";
    }
    return "Unknown";
}

/**
 * @brief Result of one pipeline stage
 *
 * details carries secondary diagnostic text, e.g. the captured transcoder output.
 */
struct StageResult
{
    bool success;
    PipelineErrorKind kind;
    std::string error_message;
    std::string details;

    StageResult() : success(true), kind(PipelineErrorKind::None) {}
    StageResult(PipelineErrorKind k, const std::string &msg, const std::string &d = "")
        : success(false), kind(k), error_message(msg), details(d) {}

    static StageResult Ok() { return StageResult(); }

    static StageResult Failure(PipelineErrorKind k, const std::string &msg, const std::string &d = "")
    {
        return StageResult(k, msg, d);
    }
};

/**
 * @brief A decoded conversion task
 */
struct VideoTask
{
    int64_t video_id = 0;
    std::string path;
};
