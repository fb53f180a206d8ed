#include "core/error_reporter.hpp"
#include "stubs/in_memory_error_log_store.hpp"
#include "test_base.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;

class ErrorReporterTest : public TestBase
{
};

TEST_F(ErrorReporterTest, BuildPayload)
{
    auto cause = StageResult::Failure(PipelineErrorKind::TranscodeError, "exit code 1", "ffmpeg output");
    json payload = ErrorReporter::buildPayload(42, "failed to convert video to dash", cause,
                                               {"Received", "Decoded"}, "2024-01-01T00:00:00.000Z");

    EXPECT_EQ(payload["video_id"], 42);
    EXPECT_EQ(payload["error"], "failed to convert video to dash");
    EXPECT_EQ(payload["kind"], "TranscodeError");
    EXPECT_EQ(payload["details"], "exit code 1");
    EXPECT_EQ(payload["context"], "ffmpeg output");
    EXPECT_EQ(payload["phases"], json::array({"Received", "Decoded"}));
    EXPECT_EQ(payload["time"], "2024-01-01T00:00:00.000Z");
}

TEST_F(ErrorReporterTest, UnknownVideoIdIsNull)
{
    auto cause = StageResult::Failure(PipelineErrorKind::DecodeError, "failed to unmarshal task", "bad json");
    json payload = ErrorReporter::buildPayload(std::nullopt, "failed to unmarshal task", cause, {}, "t");

    EXPECT_TRUE(payload["video_id"].is_null());
    EXPECT_EQ(payload["context"], "bad json");
}

TEST_F(ErrorReporterTest, ReportLogsAndPersists)
{
    InMemoryErrorLogStore store;
    ErrorReporter reporter(store, logger_);

    auto cause = StageResult::Failure(PipelineErrorKind::NoChunksFound, "failed to find chunks");
    json payload = reporter.report(5, "failed to merge chunks", cause, {"Received"});

    ASSERT_EQ(store.records.size(), 1u);
    EXPECT_EQ(store.records[0].details, payload);
    EXPECT_FALSE(store.records[0].created_at.empty());
    EXPECT_FALSE(payload.contains("context"));
    EXPECT_TRUE(logContains("Processing error error_details="));
    EXPECT_TRUE(logContains("\"kind\":\"NoChunksFound\""));
    EXPECT_TRUE(logContains("Error log stored successfully"));
}

TEST_F(ErrorReporterTest, PersistFailureIsSwallowedAndLogged)
{
    InMemoryErrorLogStore store;
    store.mode = InMemoryErrorLogStore::Mode::Fail;
    ErrorReporter reporter(store, logger_);

    auto cause = StageResult::Failure(PipelineErrorKind::StoreError, "disk I/O error");
    json payload;
    EXPECT_NO_THROW(payload = reporter.report(5, "failed to mark video as processed", cause));

    EXPECT_EQ(store.attempts, 1);
    EXPECT_EQ(payload["kind"], "StoreError");
    EXPECT_TRUE(logContains("Processing error"));
    EXPECT_TRUE(logContains("kind=ReportingFailure"));
    EXPECT_FALSE(logContains("Error log stored successfully"));
}

TEST_F(ErrorReporterTest, ThrowingStoreDoesNotEscape)
{
    InMemoryErrorLogStore store;
    store.mode = InMemoryErrorLogStore::Mode::Throw;
    ErrorReporter reporter(store, logger_);

    auto cause = StageResult::Failure(PipelineErrorKind::MergeIOError, "failed to write merged file");
    EXPECT_NO_THROW(reporter.report(6, "failed to merge chunks", cause));
    EXPECT_FALSE(reporter.persist(json{{"error", "x"}}));
    EXPECT_TRUE(logContains("connection lost"));
}

TEST_F(ErrorReporterTest, InvalidUtf8DoesNotThrow)
{
    InMemoryErrorLogStore store;
    ErrorReporter reporter(store, logger_);

    std::string bad_output = "frame \xff\xfe broken";
    auto cause = StageResult::Failure(PipelineErrorKind::TranscodeError, "exit code 1", bad_output);
    EXPECT_NO_THROW(reporter.report(7, "failed to convert video to dash", cause));
    EXPECT_EQ(store.records.size(), 1u);
}

TEST_F(ErrorReporterTest, SqliteRoundTrip)
{
    DatabaseManager dbMan(path("errors.db"));
    SqliteErrorLogStore store(dbMan);
    ErrorReporter reporter(store, logger_);

    auto cause = StageResult::Failure(PipelineErrorKind::TranscodeError,
                                      "failed to convert video to dash (exit code 1)", "ffmpeg: no such file");
    json payload = reporter.report(77, "failed to convert video to dash", cause,
                                   {"Received", "Decoded", "IdempotencyChecked", "Merged"});

    auto records = store.readAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].details, payload);
    EXPECT_EQ(records[0].details["video_id"], 77);
    EXPECT_EQ(records[0].created_at.back(), 'Z');
}

TEST_F(ErrorReporterTest, SqliteStoreFailureIsReportingFailure)
{
    DatabaseManager dbMan(path("no/such/dir/errors.db"));
    SqliteErrorLogStore store(dbMan);
    ErrorReporter reporter(store, logger_);

    auto cause = StageResult::Failure(PipelineErrorKind::StoreError, "failed to check processed state");
    EXPECT_NO_THROW(reporter.report(1, "failed to check if video is processed", cause));
    EXPECT_TRUE(logContains("kind=ReportingFailure"));
}
