#pragma once

#include "core/idempotency_store.hpp"
#include <map>
#include <string>

// In-memory IdempotencyStore with switchable failure modes
class InMemoryIdempotencyStore : public IdempotencyStore
{
public:
    ProcessedLookup isProcessed(int64_t video_id) override
    {
        ++lookups;
        ProcessedLookup lookup;
        if (fail_lookup)
        {
            lookup.ok = false;
            lookup.error_message = "database is locked";
            return lookup;
        }
        lookup.processed = records.count(video_id) > 0;
        return lookup;
    }

    MarkResult markProcessed(int64_t video_id) override
    {
        MarkResult result;
        if (fail_mark)
        {
            result.outcome = MarkOutcome::Failed;
            result.error_message = "disk I/O error";
            return result;
        }
        if (++records[video_id] > 1)
        {
            records[video_id] = 1;
            result.outcome = MarkOutcome::AlreadyMarked;
            result.error_message = "UNIQUE constraint failed: processed_videos.video_id";
        }
        return result;
    }

    std::map<int64_t, int> records;
    int lookups = 0;
    bool fail_lookup = false;
    bool fail_mark = false;
};
