#include "core/task_decoder.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

TaskDecoder::TaskDecoder(std::string allowed_root)
    : allowed_root_(std::move(allowed_root))
{
}

DecodeOutcome TaskDecoder::decode(const std::string &message) const
{
    DecodeOutcome outcome;

    json document;
    try
    {
        document = json::parse(message);
    }
    catch (const json::parse_error &e)
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", e.what());
        return outcome;
    }

    if (!document.is_object())
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", "message is not a JSON object");
        return outcome;
    }

    auto id_it = document.find("video_id");
    if (id_it == document.end() || !id_it->is_number_integer())
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", "video_id must be an integer");
        return outcome;
    }
    if (id_it->is_number_unsigned() && id_it->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX))
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", "video_id is out of range");
        return outcome;
    }
    outcome.video_id = id_it->get<int64_t>();

    auto path_it = document.find("path");
    if (path_it == document.end() || !path_it->is_string())
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", "path must be a string");
        return outcome;
    }
    std::string path = path_it->get<std::string>();
    if (path.empty())
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "failed to unmarshal task", "path must not be empty");
        return outcome;
    }

    if (!allowed_root_.empty() && !isWithinRoot(path, allowed_root_))
    {
        outcome.result = StageResult::Failure(PipelineErrorKind::DecodeError,
                                              "task path outside allowed root",
                                              path + " is not inside " + allowed_root_);
        return outcome;
    }

    VideoTask task;
    task.video_id = *outcome.video_id;
    task.path = std::move(path);
    outcome.task = std::move(task);
    outcome.result = StageResult::Ok();
    return outcome;
}

bool TaskDecoder::isWithinRoot(const std::string &path, const std::string &root)
{
    std::error_code ec;
    fs::path absolute_path = fs::absolute(path, ec);
    if (ec)
        return false;
    fs::path absolute_root = fs::absolute(root, ec);
    if (ec)
        return false;
    fs::path resolved_path = fs::weakly_canonical(absolute_path, ec);
    if (ec)
        return false;
    fs::path resolved_root = fs::weakly_canonical(absolute_root, ec);
    if (ec)
        return false;

    resolved_root = resolved_root.lexically_normal();
    if (resolved_root.has_relative_path() && resolved_root.filename().empty())
        resolved_root = resolved_root.parent_path();

    fs::path relative = resolved_path.lexically_normal().lexically_relative(resolved_root);
    if (relative.empty() || relative == ".")
        return false;
    return *relative.begin() != "..";
}
