#pragma once

#include "core/chunk_merger.hpp"
#include "core/error_reporter.hpp"
#include "core/idempotency_store.hpp"
#include "core/processing_result.hpp"
#include "core/task_decoder.hpp"
#include "core/transcoder.hpp"
#include "core/worker_config.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TaskState
{
    Received,
    Decoded,
    IdempotencyChecked,
    Merged,
    Transcoded,
    Completed,
    Failed
};

const char *taskStateName(TaskState state);

/**
 * @brief Final result of one task attempt
 */
struct TaskOutcome
{
    TaskState state = TaskState::Received;
    std::vector<TaskState> history;
    std::optional<int64_t> video_id;
    // Terminal failure, success when the task completed
    StageResult error;
    // Already processed; nothing was done
    bool skipped = false;
    // Another worker recorded success first
    bool already_marked = false;
    // At least one chunk had no sequence number
    bool degraded = false;
    // Merged artifact could not be deleted after success
    bool cleanup_failed = false;

    bool completed() const { return state == TaskState::Completed; }
};

/**
 * @brief Runs one conversion task end to end
 *
 * Received -> Decoded -> IdempotencyChecked -> Merged -> Transcoded -> Completed, with
 * Failed reachable from every non-terminal state. Every failure is reported once and
 * ends the attempt; there is no in-process retry.
 *
 * After a successful transcode the success record is written before the merged
 * artifact is deleted. A deletion failure is reported but the task still completes.
 */
class TaskOrchestrator
{
public:
    TaskOrchestrator(const WorkerSettings &settings,
                     IdempotencyStore &store,
                     Transcoder &transcoder,
                     ErrorReporter &reporter,
                     std::shared_ptr<spdlog::logger> logger = nullptr,
                     ChunkMerger::OutputFactory output_factory = nullptr);

    /**
     * @brief Decode a raw message and process it
     */
    TaskOutcome handle(const std::string &message);

    /**
     * @brief Process an already decoded task
     */
    TaskOutcome process(const VideoTask &task);

    std::string mergedFilePath(const VideoTask &task) const;
    std::string outputDirPath(const VideoTask &task) const;

private:
    void advance(TaskOutcome &outcome, TaskState next) const;
    TaskOutcome &fail(TaskOutcome &outcome, const std::string &message, const StageResult &cause);
    TaskOutcome &run(TaskOutcome &outcome, const VideoTask &task);

    WorkerSettings settings_;
    IdempotencyStore &store_;
    Transcoder &transcoder_;
    ErrorReporter &reporter_;
    std::shared_ptr<spdlog::logger> logger_;
    TaskDecoder decoder_;
    ChunkMerger merger_;
};
