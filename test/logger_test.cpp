#include <gtest/gtest.h>

#include <recordsvc/util/logger.h>

#include <ostream>
#include <sstream>
#include <streambuf>
#include <thread>
#include <vector>

using namespace recordsvc;

TEST(LoggerTest, WritesFormattedLineToSink) {
    std::ostringstream sink;
    Logger logger(&sink);

    logger.info("RecordService", "GetRecord called with ID: 1");

    std::string line = sink.str();
    EXPECT_NE(line.find("] [INFO] [RecordService] GetRecord called with ID: 1\n"),
              std::string::npos);
    EXPECT_EQ(line.front(), '[');
}

TEST(LoggerTest, KeepsEntries) {
    Logger logger(nullptr);
    logger.info("A", "first");
    logger.warning("B", "second");

    auto entries = logger.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].component, "A");
    EXPECT_EQ(entries[0].message, "first");
    EXPECT_EQ(entries[1].level, LogLevel::Warning);
    EXPECT_GT(entries[1].timestamp, 0u);
}

TEST(LoggerTest, MinLevelFilters) {
    std::ostringstream sink;
    Logger logger(&sink);
    logger.setMinLevel(LogLevel::Warning);
    EXPECT_EQ(logger.minLevel(), LogLevel::Warning);

    logger.debug("C", "dropped");
    logger.info("C", "dropped");
    logger.error("C", "kept");

    EXPECT_EQ(logger.size(), 1u);
    EXPECT_EQ(sink.str().find("dropped"), std::string::npos);
    EXPECT_NE(sink.str().find("[ERROR] [C] kept"), std::string::npos);
}

TEST(LoggerTest, BoundedCapacity) {
    Logger logger(nullptr, 3);
    for (int i = 0; i < 10; ++i) {
        logger.info("C", std::to_string(i));
    }

    auto entries = logger.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "7");
    EXPECT_EQ(entries[2].message, "9");
}

TEST(LoggerTest, Clear) {
    Logger logger(nullptr);
    logger.info("C", "x");
    logger.clear();
    EXPECT_EQ(logger.size(), 0u);
}

namespace {

// Rejects every character, so a write sets badbit.
class FailingBuf : public std::streambuf {
protected:
    int overflow(int) override { return traits_type::eof(); }
};

} // namespace

TEST(LoggerTest, FailedSinkDoesNotThrow) {
    FailingBuf buf;
    std::ostream sink(&buf);
    sink.exceptions(std::ios::badbit);   // writes now throw

    Logger logger(&sink);
    EXPECT_NO_THROW(logger.error("C", "sink is broken"));
    EXPECT_EQ(logger.size(), 1u);
}

TEST(LoggerTest, Format) {
    LogEntry entry{42, LogLevel::Debug, "Comp", "msg"};
    EXPECT_EQ(Logger::format(entry), "[42] [DEBUG] [Comp] msg");
}

TEST(LoggerTest, ConcurrentWriters) {
    Logger logger(nullptr, 10000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 250; ++i) logger.info("T", "line");
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(logger.size(), 1000u);
}
