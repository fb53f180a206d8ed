#pragma once

#include "core/processing_result.hpp"
#include <optional>
#include <string>

/**
 * @brief Outcome of decoding one inbound message
 *
 * task is set only on success. video_id is set whenever that field parsed,
 * even if the message was rejected, so failures can still name the task.
 */
struct DecodeOutcome
{
    StageResult result;
    std::optional<VideoTask> task;
    std::optional<int64_t> video_id;
};

/**
 * @brief Parses `{ "video_id": <integer>, "path": <string> }` messages
 */
class TaskDecoder
{
public:
    /**
     * @param allowed_root When non-empty, decoded paths must resolve inside it
     */
    explicit TaskDecoder(std::string allowed_root = "");

    DecodeOutcome decode(const std::string &message) const;

    /**
     * @brief Check that path resolves inside root after normalisation
     */
    static bool isWithinRoot(const std::string &path, const std::string &root);

private:
    std::string allowed_root_;
};
