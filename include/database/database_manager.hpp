#pragma once

#include "database/database_access_queue.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Outcome of inserting a success record
 */
enum class MarkOutcome
{
    Marked,
    AlreadyMarked,
    Failed
};

/**
 * @brief One row of process_errors_log
 */
struct ErrorLogRow
{
    int64_t id = 0;
    std::string error_details;
    std::string created_at;
};

/**
 * @brief SQLite store for processed videos and the error log
 *
 * All statements run on the DatabaseAccessQueue thread, so one instance can be
 * shared by concurrently running tasks.
 */
class DatabaseManager
{
public:
    /**
     * @brief Constructor - opens the database and creates the tables
     * @param db_path Path to SQLite database file
     * @param busy_timeout_ms How long a statement waits on a locked database
     */
    explicit DatabaseManager(const std::string &db_path, int busy_timeout_ms = 5000);

    /**
     * @brief Destructor - closes database connection
     */
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    /**
     * @brief Check if the database connection is valid
     * @return true if database is initialized and connected, false otherwise
     */
    bool isValid();

    /**
     * @brief Check for a success record
     * @return true/false, or std::nullopt when the lookup itself failed
     */
    std::optional<bool> isVideoProcessed(int64_t video_id, std::string &error_message);

    /**
     * @brief Insert a success record stamped with processed_at
     * @return AlreadyMarked when the UNIQUE index rejected a second success record
     */
    MarkOutcome markVideoProcessed(int64_t video_id, const std::string &processed_at, std::string &error_message);

    /**
     * @brief Number of success records for a video
     */
    int countSuccessRecords(int64_t video_id);

    /**
     * @brief Append a row to process_errors_log
     */
    DBOpResult insertErrorLog(const std::string &error_details, const std::string &created_at);

    /**
     * @brief All error log rows, oldest first
     */
    std::vector<ErrorLogRow> getErrorLogs();

    /**
     * @brief Wait for all queued operations to complete
     */
    void waitForWrites();

private:
    void initialize();
    bool createProcessedVideosTable();
    bool createProcessErrorsLogTable();

    /**
     * @brief Execute a SQL statement
     * @return DBOpResult with success flag and error message
     */
    DBOpResult executeStatement(const std::string &sql);

    sqlite3 *db_;
    int busy_timeout_ms_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
