#include "core/idempotency_store.hpp"
#include "core/time_utils.hpp"

SqliteIdempotencyStore::SqliteIdempotencyStore(DatabaseManager &dbMan)
    : dbMan_(dbMan)
{
}

ProcessedLookup SqliteIdempotencyStore::isProcessed(int64_t video_id)
{
    ProcessedLookup lookup;
    std::optional<bool> processed = dbMan_.isVideoProcessed(video_id, lookup.error_message);
    if (!processed)
    {
        lookup.ok = false;
        return lookup;
    }
    lookup.processed = *processed;
    return lookup;
}

MarkResult SqliteIdempotencyStore::markProcessed(int64_t video_id)
{
    MarkResult result;
    result.outcome = dbMan_.markVideoProcessed(video_id, TimeUtils::nowIso8601(), result.error_message);
    return result;
}
