#include "core/error_reporter.hpp"
#include "core/time_utils.hpp"
#include "logging/logger.hpp"

using json = nlohmann::json;

namespace
{
    std::string serialize(const json &payload)
    {
        // Paths and encoder output are not guaranteed to be valid UTF-8
        return payload.dump(-1, ' ', false, json::error_handler_t::replace);
    }
}

SqliteErrorLogStore::SqliteErrorLogStore(DatabaseManager &dbMan)
    : dbMan_(dbMan)
{
}

DBOpResult SqliteErrorLogStore::append(const json &details, const std::string &created_at)
{
    return dbMan_.insertErrorLog(serialize(details), created_at);
}

std::vector<ErrorRecord> SqliteErrorLogStore::readAll()
{
    std::vector<ErrorRecord> records;
    for (const auto &row : dbMan_.getErrorLogs())
    {
        json details = json::parse(row.error_details, nullptr, false);
        if (details.is_discarded())
        {
            Logger::warn("Skipping unparsable error log row " + std::to_string(row.id));
            continue;
        }
        ErrorRecord record;
        record.id = row.id;
        record.details = std::move(details);
        record.created_at = row.created_at;
        records.push_back(std::move(record));
    }
    return records;
}

ErrorReporter::ErrorReporter(ErrorLogStore &store, std::shared_ptr<spdlog::logger> logger)
    : store_(store), logger_(logger ? std::move(logger) : Logger::get())
{
}

json ErrorReporter::buildPayload(std::optional<int64_t> video_id, const std::string &message,
                                 const StageResult &cause, const std::vector<std::string> &phases,
                                 const std::string &time)
{
    json payload;
    payload["video_id"] = video_id ? json(*video_id) : json(nullptr);
    payload["error"] = message;
    payload["kind"] = pipelineErrorKindName(cause.kind);
    payload["details"] = cause.error_message;
    if (!cause.details.empty())
        payload["context"] = cause.details;
    payload["phases"] = phases;
    payload["time"] = time;
    return payload;
}

json ErrorReporter::report(std::optional<int64_t> video_id, const std::string &message,
                           const StageResult &cause, const std::vector<std::string> &phases)
{
    json payload = buildPayload(video_id, message, cause, phases, TimeUtils::nowIso8601());
    logger_->error("Processing error error_details={}", serialize(payload));

    if (persist(payload))
        logger_->info("Error log stored successfully error={}", cause.error_message);
    return payload;
}

bool ErrorReporter::persist(const json &payload)
{
    DBOpResult result;
    try
    {
        result = store_.append(payload, TimeUtils::nowIso8601());
    }
    catch (const std::exception &e)
    {
        result = DBOpResult(false, e.what());
    }

    if (!result.success)
    {
        logger_->error("Error storing error log in database kind={} error={}",
                       pipelineErrorKindName(PipelineErrorKind::ReportingFailure), result.error_message);
        return false;
    }
    return true;
}
