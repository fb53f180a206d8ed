#include "database/database_manager.hpp"
#include "database/database_access_queue.hpp"
#include "logging/logger.hpp"
#include <sqlite3.h>
#include <stdexcept>

DatabaseManager::DatabaseManager(const std::string &db_path, int busy_timeout_ms)
    : db_(nullptr), busy_timeout_ms_(busy_timeout_ms)
{
    Logger::info("DatabaseManager constructor called for: " + db_path);
    // Initialize the access queue first
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    // Enqueue the open operation and wait for it to complete
    auto open_future = access_queue_->enqueueRead([db_path](DatabaseManager &dbMan)
                                                  {
        int rc = sqlite3_open(db_path.c_str(), &dbMan.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(dbMan.db_)));
            sqlite3_close(dbMan.db_);
            dbMan.db_ = nullptr;
            return false;
        }
        Logger::info("Database opened successfully: " + db_path);
        sqlite3_extended_result_codes(dbMan.db_, 1);
        sqlite3_busy_timeout(dbMan.db_, dbMan.busy_timeout_ms_);
        // Enable WAL mode for better concurrency
        rc = sqlite3_exec(dbMan.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        sqlite3_exec(dbMan.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(dbMan.db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        return true; });

    bool open_success = false;
    try
    {
        open_success = std::any_cast<bool>(open_future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Database open failed: " + std::string(e.what()));
    }
    if (!open_success)
    {
        Logger::error("Database open failed in access queue");
        return;
    }
    initialize();
    Logger::info("DatabaseManager initialization completed");
}

DatabaseManager::~DatabaseManager()
{
    Logger::debug("DatabaseManager destructor called");
    if (access_queue_)
    {
        // Enqueue the close operation and wait for it to complete
        auto close_future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                                       {
            if (dbMan.db_)
            {
                sqlite3_close(dbMan.db_);
                dbMan.db_ = nullptr;
                Logger::debug("Database connection closed");
            }
            return true; });
        try
        {
            close_future.get();
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to close database: " + std::string(e.what()));
        }
        access_queue_->stop();
        access_queue_.reset();
    }
}

void DatabaseManager::waitForWrites()
{
    if (access_queue_)
    {
        access_queue_->wait_for_completion();
    }
}

void DatabaseManager::initialize()
{
    Logger::info("Initializing database tables");
    if (!createProcessedVideosTable())
        Logger::error("Failed to create processed_videos table");
    if (!createProcessErrorsLogTable())
        Logger::error("Failed to create process_errors_log table");
    Logger::info("Database tables initialization completed");
}

bool DatabaseManager::createProcessedVideosTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS processed_videos (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            video_id INTEGER NOT NULL,
            status TEXT NOT NULL,
            processed_at TEXT NOT NULL
        )
    )";
    if (!executeStatement(sql).success)
        return false;

    // At most one success record per video
    const std::string index_sql = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_processed_videos_success
        ON processed_videos(video_id) WHERE status = 'success'
    )";
    return executeStatement(index_sql).success;
}

bool DatabaseManager::createProcessErrorsLogTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS process_errors_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            error_details TEXT NOT NULL,
            created_at TEXT NOT NULL
        )
    )";
    return executeStatement(sql).success;
}

DBOpResult DatabaseManager::executeStatement(const std::string &sql)
{
    auto future = access_queue_->enqueueWrite([sql](DatabaseManager &dbMan)
                                              {
        if (!dbMan.db_)
            return WriteOperationResult::Failure("Database not initialized");
        char *err_msg = nullptr;
        int rc = sqlite3_exec(dbMan.db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "SQL execution failed: " + std::string(err_msg ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
            Logger::error(msg);
            return WriteOperationResult::Failure(msg, rc);
        }
        return WriteOperationResult(); });
    WriteOperationResult result = future.get();
    return DBOpResult(result.success, result.error_message);
}

bool DatabaseManager::isValid()
{
    if (!access_queue_)
        return false;
    auto future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                             { return std::any(dbMan.db_ != nullptr); });
    try
    {
        return std::any_cast<bool>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Database validity check failed: " + std::string(e.what()));
        return false;
    }
}

std::optional<bool> DatabaseManager::isVideoProcessed(int64_t video_id, std::string &error_message)
{
    auto future = access_queue_->enqueueRead([video_id](DatabaseManager &dbMan)
                                             {
        if (!dbMan.db_)
            throw std::runtime_error("Database not initialized");
        const std::string sql =
            "SELECT EXISTS(SELECT 1 FROM processed_videos WHERE video_id = ? AND status = 'success')";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(dbMan.db_)));
        sqlite3_bind_int64(stmt, 1, video_id);
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW)
        {
            std::string msg = "Failed to query processed_videos: " + std::string(sqlite3_errmsg(dbMan.db_));
            sqlite3_finalize(stmt);
            throw std::runtime_error(msg);
        }
        bool processed = sqlite3_column_int(stmt, 0) != 0;
        sqlite3_finalize(stmt);
        return std::any(processed); });
    try
    {
        return std::any_cast<bool>(future.get());
    }
    catch (const std::exception &e)
    {
        error_message = e.what();
        return std::nullopt;
    }
}

MarkOutcome DatabaseManager::markVideoProcessed(int64_t video_id, const std::string &processed_at,
                                                std::string &error_message)
{
    auto future = access_queue_->enqueueWrite([video_id, processed_at](DatabaseManager &dbMan)
                                              {
        if (!dbMan.db_)
            return WriteOperationResult::Failure("Database not initialized");
        const std::string sql =
            "INSERT INTO processed_videos (video_id, status, processed_at) VALUES (?, 'success', ?)";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return WriteOperationResult::Failure("Failed to prepare statement: " + std::string(sqlite3_errmsg(dbMan.db_)));
        sqlite3_bind_int64(stmt, 1, video_id);
        sqlite3_bind_text(stmt, 2, processed_at.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        WriteOperationResult result;
        if (rc != SQLITE_DONE)
            result = WriteOperationResult::Failure(sqlite3_errmsg(dbMan.db_), sqlite3_extended_errcode(dbMan.db_));
        sqlite3_finalize(stmt);
        return result; });

    WriteOperationResult result = future.get();
    if (result.success)
        return MarkOutcome::Marked;
    error_message = result.error_message;
    if (result.error_code == SQLITE_CONSTRAINT_UNIQUE || result.error_code == SQLITE_CONSTRAINT_PRIMARYKEY)
        return MarkOutcome::AlreadyMarked;
    return MarkOutcome::Failed;
}

int DatabaseManager::countSuccessRecords(int64_t video_id)
{
    auto future = access_queue_->enqueueRead([video_id](DatabaseManager &dbMan)
                                             {
        if (!dbMan.db_)
            return std::any(-1);
        const std::string sql =
            "SELECT COUNT(*) FROM processed_videos WHERE video_id = ? AND status = 'success'";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return std::any(-1);
        sqlite3_bind_int64(stmt, 1, video_id);
        int count = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            count = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
        return std::any(count); });
    try
    {
        return std::any_cast<int>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to count success records: " + std::string(e.what()));
        return -1;
    }
}

DBOpResult DatabaseManager::insertErrorLog(const std::string &error_details, const std::string &created_at)
{
    auto future = access_queue_->enqueueWrite([error_details, created_at](DatabaseManager &dbMan)
                                              {
        if (!dbMan.db_)
            return WriteOperationResult::Failure("Database not initialized");
        const std::string sql = "INSERT INTO process_errors_log (error_details, created_at) VALUES (?, ?)";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return WriteOperationResult::Failure("Failed to prepare statement: " + std::string(sqlite3_errmsg(dbMan.db_)));
        sqlite3_bind_text(stmt, 1, error_details.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, created_at.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        WriteOperationResult result;
        if (rc != SQLITE_DONE)
            result = WriteOperationResult::Failure(sqlite3_errmsg(dbMan.db_), sqlite3_extended_errcode(dbMan.db_));
        sqlite3_finalize(stmt);
        return result; });

    WriteOperationResult result = future.get();
    return DBOpResult(result.success, result.error_message);
}

std::vector<ErrorLogRow> DatabaseManager::getErrorLogs()
{
    auto future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                             {
        std::vector<ErrorLogRow> rows;
        if (!dbMan.db_)
            return std::any(rows);
        const std::string sql = "SELECT id, error_details, created_at FROM process_errors_log ORDER BY id";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return std::any(rows);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            ErrorLogRow row;
            row.id = sqlite3_column_int64(stmt, 0);
            const unsigned char *details = sqlite3_column_text(stmt, 1);
            const unsigned char *created = sqlite3_column_text(stmt, 2);
            row.error_details = details ? reinterpret_cast<const char *>(details) : "";
            row.created_at = created ? reinterpret_cast<const char *>(created) : "";
            rows.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);
        return std::any(rows); });
    try
    {
        return std::any_cast<std::vector<ErrorLogRow>>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to read error log: " + std::string(e.what()));
        return {};
    }
}
