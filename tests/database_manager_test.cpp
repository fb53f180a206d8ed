#include "database/database_manager.hpp"
#include "test_base.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

class DatabaseManagerTest : public TestBase
{
protected:
    std::string dbPath() const { return path("test_database_manager.db"); }
};

TEST_F(DatabaseManagerTest, DatabaseInitialization)
{
    DatabaseManager dbMan(dbPath());

    EXPECT_TRUE(dbMan.isValid());
    EXPECT_TRUE(fs::exists(dbPath()));
    EXPECT_EQ(dbMan.countSuccessRecords(1), 0);
    EXPECT_TRUE(dbMan.getErrorLogs().empty());
}

TEST_F(DatabaseManagerTest, UnopenableDatabaseIsInvalid)
{
    DatabaseManager dbMan(path("missing/dir/test.db"));
    EXPECT_FALSE(dbMan.isValid());

    std::string error;
    EXPECT_FALSE(dbMan.isVideoProcessed(1, error).has_value());
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(dbMan.markVideoProcessed(1, "2024-01-01T00:00:00.000Z", error), MarkOutcome::Failed);
    EXPECT_FALSE(dbMan.insertErrorLog("{}", "2024-01-01T00:00:00.000Z").success);
}

TEST_F(DatabaseManagerTest, MarkAndLookup)
{
    DatabaseManager dbMan(dbPath());
    std::string error;

    auto before = dbMan.isVideoProcessed(42, error);
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(*before);

    EXPECT_EQ(dbMan.markVideoProcessed(42, "2024-01-01T00:00:00.000Z", error), MarkOutcome::Marked);

    auto after = dbMan.isVideoProcessed(42, error);
    ASSERT_TRUE(after.has_value());
    EXPECT_TRUE(*after);

    auto other = dbMan.isVideoProcessed(43, error);
    ASSERT_TRUE(other.has_value());
    EXPECT_FALSE(*other);
}

TEST_F(DatabaseManagerTest, SecondSuccessRecordIsRejected)
{
    DatabaseManager dbMan(dbPath());
    std::string error;

    EXPECT_EQ(dbMan.markVideoProcessed(7, "2024-01-01T00:00:00.000Z", error), MarkOutcome::Marked);
    EXPECT_EQ(dbMan.markVideoProcessed(7, "2024-01-01T00:00:01.000Z", error), MarkOutcome::AlreadyMarked);
    EXPECT_NE(error.find("UNIQUE"), std::string::npos);
    EXPECT_EQ(dbMan.countSuccessRecords(7), 1);
}

TEST_F(DatabaseManagerTest, ConcurrentMarksLeaveOneRecord)
{
    DatabaseManager dbMan(dbPath());
    std::atomic<int> marked{0};
    std::atomic<int> already{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]()
                             {
            std::string error;
            MarkOutcome outcome = dbMan.markVideoProcessed(99, "2024-01-01T00:00:00.000Z", error);
            if (outcome == MarkOutcome::Marked)
                ++marked;
            else if (outcome == MarkOutcome::AlreadyMarked)
                ++already; });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(marked.load(), 1);
    EXPECT_EQ(already.load(), 7);
    EXPECT_EQ(dbMan.countSuccessRecords(99), 1);
}

TEST_F(DatabaseManagerTest, RecordsSurviveReopen)
{
    {
        DatabaseManager dbMan(dbPath());
        std::string error;
        EXPECT_EQ(dbMan.markVideoProcessed(5, "2024-01-01T00:00:00.000Z", error), MarkOutcome::Marked);
        EXPECT_TRUE(dbMan.insertErrorLog(R"({"error":"x"})", "2024-01-01T00:00:00.000Z").success);
        dbMan.waitForWrites();
    }

    DatabaseManager reopened(dbPath());
    std::string error;
    auto processed = reopened.isVideoProcessed(5, error);
    ASSERT_TRUE(processed.has_value());
    EXPECT_TRUE(*processed);

    auto logs = reopened.getErrorLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].error_details, R"({"error":"x"})");
    EXPECT_EQ(logs[0].created_at, "2024-01-01T00:00:00.000Z");
}

TEST_F(DatabaseManagerTest, ErrorLogsAreOrdered)
{
    DatabaseManager dbMan(dbPath());
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(dbMan.insertErrorLog("{\"n\":" + std::to_string(i) + "}", "t").success);

    auto logs = dbMan.getErrorLogs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs[0].error_details, "{\"n\":0}");
    EXPECT_EQ(logs[2].error_details, "{\"n\":2}");
    EXPECT_LT(logs[0].id, logs[1].id);
}
