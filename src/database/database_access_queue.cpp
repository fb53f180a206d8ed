#include "database/database_access_queue.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

DatabaseAccessQueue::DatabaseAccessQueue(DatabaseManager &dbMan)
    : db_manager_(dbMan), should_stop_(false), in_flight_(0)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

std::future<WriteOperationResult> DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    Logger::trace("Enqueueing database write operation");
    std::promise<WriteOperationResult> promise;
    std::future<WriteOperationResult> future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (should_stop_)
        {
            promise.set_value(WriteOperationResult::Failure("database access queue stopped"));
            return future;
        }
        operation_queue_.push(std::make_pair(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    Logger::trace("Enqueueing database read operation");
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (should_stop_)
        {
            promise.set_exception(std::make_exception_ptr(std::runtime_error("database access queue stopped")));
            return future;
        }
        operation_queue_.push(std::make_pair(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

void DatabaseAccessQueue::wait_for_completion()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
                  { return operation_queue_.empty() && in_flight_ == 0; });
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        std::variant<QueuedWrite, QueuedRead> operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (should_stop_ && operation_queue_.empty())
            {
                break;
            }

            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
            ++in_flight_;
        }

        // Handle write operation
        if (std::holds_alternative<QueuedWrite>(operation))
        {
            auto &[write_op, promise] = std::get<QueuedWrite>(operation);
            try
            {
                promise.set_value(write_op(db_manager_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database write operation failed: " + std::string(e.what()));
                promise.set_value(WriteOperationResult::Failure(e.what()));
            }
        }
        // Handle read operation
        else
        {
            auto &[read_op, promise] = std::get<QueuedRead>(operation);
            try
            {
                promise.set_value(read_op(db_manager_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database read operation failed: " + std::string(e.what()));
                promise.set_exception(std::current_exception());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (operation_queue_.empty() && in_flight_ == 0)
            {
                idle_cv_.notify_all();
            }
        }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    idle_cv_.notify_all();
}
