#pragma once

#include "database/database_manager.hpp"
#include <cstdint>
#include <string>

/**
 * @brief Result of a success-record lookup
 *
 * ok is false when the store could not answer; processed is meaningless then.
 */
struct ProcessedLookup
{
    bool ok = true;
    bool processed = false;
    std::string error_message;
};

struct MarkResult
{
    MarkOutcome outcome = MarkOutcome::Marked;
    std::string error_message;
};

/**
 * @brief Durable record of videos that completed successfully
 *
 * Implementations must reject a second success record for the same video at the
 * storage level and report it as MarkOutcome::AlreadyMarked.
 */
class IdempotencyStore
{
public:
    virtual ~IdempotencyStore() = default;
    virtual ProcessedLookup isProcessed(int64_t video_id) = 0;
    virtual MarkResult markProcessed(int64_t video_id) = 0;
};

class SqliteIdempotencyStore : public IdempotencyStore
{
public:
    explicit SqliteIdempotencyStore(DatabaseManager &dbMan);

    ProcessedLookup isProcessed(int64_t video_id) override;
    MarkResult markProcessed(int64_t video_id) override;

private:
    DatabaseManager &dbMan_;
};
