#pragma once

#include <future>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <any>
#include <atomic>
#include <chrono>
#include <string>
#include <variant>

class DatabaseManager;

struct WriteOperationResult
{
    bool success;
    std::string error_message;
    // sqlite3 extended result code of the failing step, 0 on success
    int error_code;

    WriteOperationResult(bool s = true, const std::string &msg = "", int code = 0)
        : success(s), error_message(msg), error_code(code) {}

    static WriteOperationResult Failure(const std::string &msg = "", int code = 0)
    {
        return WriteOperationResult(false, msg, code);
    }
};

using WriteOperation = std::function<WriteOperationResult(DatabaseManager &)>;
using ReadOperation = std::function<std::any(DatabaseManager &)>;

/**
 * @brief Serializes every statement against one sqlite3 handle on a dedicated thread
 */
class DatabaseAccessQueue
{
public:
    /**
     * @brief Constructor
     * @param dbMan Reference to the DatabaseManager instance
     */
    explicit DatabaseAccessQueue(DatabaseManager &dbMan);
    ~DatabaseAccessQueue();

    std::future<WriteOperationResult> enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);
    // Wait for all pending operations to complete
    void wait_for_completion();

    // Stop the access queue; operations already queued still run
    void stop();

private:
    void access_thread_worker();

    using QueuedWrite = std::pair<WriteOperation, std::promise<WriteOperationResult>>;
    using QueuedRead = std::pair<ReadOperation, std::promise<std::any>>;

    DatabaseManager &db_manager_;
    std::queue<std::variant<QueuedWrite, QueuedRead>> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_;
    size_t in_flight_;
};
