#include "core/task_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace
{
    ChunkMerger::Options mergerOptions(const WorkerSettings &settings)
    {
        ChunkMerger::Options options;
        options.chunk_extension = settings.chunk_extension;
        options.buffer_size = settings.merge_buffer_size;
        options.reject_unnumbered = settings.reject_unnumbered_chunks;
        return options;
    }

    std::vector<std::string> stateNames(const std::vector<TaskState> &history)
    {
        std::vector<std::string> names;
        names.reserve(history.size());
        for (TaskState state : history)
            names.push_back(taskStateName(state));
        return names;
    }
}

const char *taskStateName(TaskState state)
{
    switch (state)
    {
    case TaskState::Received:
        return "Received";
    case TaskState::Decoded:
        return "Decoded";
    case TaskState::IdempotencyChecked:
        return "IdempotencyChecked";
    case TaskState::Merged:
        return "Merged";
    case TaskState::Transcoded:
        return "Transcoded";
    case TaskState::Completed:
        return "Completed";
    case TaskState::Failed:
        return "Failed";
    }
    return "Unknown";
}

TaskOrchestrator::TaskOrchestrator(const WorkerSettings &settings,
                                   IdempotencyStore &store,
                                   Transcoder &transcoder,
                                   ErrorReporter &reporter,
                                   std::shared_ptr<spdlog::logger> logger,
                                   ChunkMerger::OutputFactory output_factory)
    : settings_(settings),
      store_(store),
      transcoder_(transcoder),
      reporter_(reporter),
      logger_(logger ? std::move(logger) : Logger::get()),
      decoder_(settings.allowed_root),
      merger_(mergerOptions(settings), logger_, std::move(output_factory))
{
}

std::string TaskOrchestrator::mergedFilePath(const VideoTask &task) const
{
    return (std::filesystem::path(task.path) / settings_.merged_file_name).string();
}

std::string TaskOrchestrator::outputDirPath(const VideoTask &task) const
{
    return (std::filesystem::path(task.path) / settings_.output_dir_name).string();
}

void TaskOrchestrator::advance(TaskOutcome &outcome, TaskState next) const
{
    outcome.state = next;
    outcome.history.push_back(next);
    logger_->debug("Task state video_id={} state={}",
                   outcome.video_id ? std::to_string(*outcome.video_id) : std::string("unknown"),
                   taskStateName(next));
}

TaskOutcome &TaskOrchestrator::fail(TaskOutcome &outcome, const std::string &message, const StageResult &cause)
{
    outcome.error = cause;
    reporter_.report(outcome.video_id, message, cause, stateNames(outcome.history));
    advance(outcome, TaskState::Failed);
    return outcome;
}

TaskOutcome TaskOrchestrator::handle(const std::string &message)
{
    TaskOutcome outcome;
    outcome.history.push_back(TaskState::Received);

    DecodeOutcome decoded = decoder_.decode(message);
    outcome.video_id = decoded.video_id;
    if (!decoded.result.success)
    {
        return fail(outcome, decoded.result.error_message, decoded.result);
    }
    advance(outcome, TaskState::Decoded);
    return run(outcome, *decoded.task);
}

TaskOutcome TaskOrchestrator::process(const VideoTask &task)
{
    TaskOutcome outcome;
    outcome.video_id = task.video_id;
    outcome.history.push_back(TaskState::Received);
    advance(outcome, TaskState::Decoded);
    return run(outcome, task);
}

TaskOutcome &TaskOrchestrator::run(TaskOutcome &outcome, const VideoTask &task)
{
    ProcessedLookup lookup = store_.isProcessed(task.video_id);
    if (!lookup.ok)
    {
        if (!settings_.reprocess_on_lookup_failure)
        {
            return fail(outcome, "failed to check if video is processed",
                        StageResult::Failure(PipelineErrorKind::StoreError, lookup.error_message));
        }
        logger_->warn("Processed-state lookup failed, reprocessing video_id={} error={}",
                      task.video_id, lookup.error_message);
    }
    else if (lookup.processed)
    {
        logger_->info("Video already processed, skipping video_id={} path={}", task.video_id, task.path);
        outcome.skipped = true;
        advance(outcome, TaskState::IdempotencyChecked);
        advance(outcome, TaskState::Completed);
        return outcome;
    }
    advance(outcome, TaskState::IdempotencyChecked);

    const std::string merged_file = mergedFilePath(task);
    MergeResult merged = merger_.merge(task.path, merged_file);
    outcome.degraded = merged.degraded;
    if (!merged.status.success)
    {
        return fail(outcome, "failed to merge chunks", merged.status);
    }
    advance(outcome, TaskState::Merged);

    TranscodeResult transcoded = transcoder_.encode(merged_file, outputDirPath(task));
    if (!transcoded.status.success)
    {
        return fail(outcome, "failed to convert video to " + settings_.output_format, transcoded.status);
    }
    advance(outcome, TaskState::Transcoded);

    MarkResult marked = store_.markProcessed(task.video_id);
    switch (marked.outcome)
    {
    case MarkOutcome::Marked:
        logger_->info("Video marked as processed video_id={}", task.video_id);
        break;
    case MarkOutcome::AlreadyMarked:
        logger_->info("Video already marked as processed by another worker video_id={}", task.video_id);
        outcome.already_marked = true;
        break;
    case MarkOutcome::Failed:
        return fail(outcome, "failed to mark video as processed",
                    StageResult::Failure(PipelineErrorKind::StoreError, marked.error_message));
    }

    logger_->info("Removing merged file path={}", merged_file);
    std::string remove_error;
    if (!FileUtils::removeFile(merged_file, remove_error))
    {
        outcome.cleanup_failed = true;
        logger_->warn("Merged file left behind after successful conversion video_id={} path={}",
                      task.video_id, merged_file);
        reporter_.report(outcome.video_id, "failed to remove merged file",
                         StageResult::Failure(PipelineErrorKind::CleanupError, remove_error, merged_file),
                         stateNames(outcome.history));
    }

    advance(outcome, TaskState::Completed);
    logger_->info("Video processed video_id={} output={}", task.video_id, outputDirPath(task));
    return outcome;
}
