#pragma once

#include "core/processing_result.hpp"
#include "database/database_manager.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A persisted error record read back from the store
 */
struct ErrorRecord
{
    int64_t id = 0;
    nlohmann::json details;
    std::string created_at;
};

/**
 * @brief Append-only sink for structured error records
 */
class ErrorLogStore
{
public:
    virtual ~ErrorLogStore() = default;
    virtual DBOpResult append(const nlohmann::json &details, const std::string &created_at) = 0;
};

class SqliteErrorLogStore : public ErrorLogStore
{
public:
    explicit SqliteErrorLogStore(DatabaseManager &dbMan);

    DBOpResult append(const nlohmann::json &details, const std::string &created_at) override;

    /**
     * @brief All records, oldest first; rows whose payload no longer parses are skipped
     */
    std::vector<ErrorRecord> readAll();

private:
    DatabaseManager &dbMan_;
};

/**
 * @brief Logs and persists pipeline failures
 *
 * Reporting never throws. A failure to persist is logged and otherwise ignored so it
 * cannot mask the failure being reported.
 */
class ErrorReporter
{
public:
    explicit ErrorReporter(ErrorLogStore &store, std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Build, log and persist the record for one failure
     * @param video_id Task id when known
     * @param message Human readable description of the failing phase
     * @param cause Underlying stage failure
     * @param phases States the task passed through before failing
     * @return The payload that was logged
     */
    nlohmann::json report(std::optional<int64_t> video_id, const std::string &message,
                          const StageResult &cause, const std::vector<std::string> &phases = {});

    /**
     * @brief Persist a payload verbatim
     * @return false on ReportingFailure
     */
    bool persist(const nlohmann::json &payload);

    static nlohmann::json buildPayload(std::optional<int64_t> video_id, const std::string &message,
                                       const StageResult &cause, const std::vector<std::string> &phases,
                                       const std::string &time);

private:
    ErrorLogStore &store_;
    std::shared_ptr<spdlog::logger> logger_;
};
