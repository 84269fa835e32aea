#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <thread>
#include <vector>

#include "logger.hpp"

using ::testing::HasSubstr;
using ::testing::Not;

TEST(LoggerTests, VerbosityMapsToLevels) {
    EXPECT_EQ(logger::levelFromVerbosity(1), logger::TRACE);
    EXPECT_EQ(logger::levelFromVerbosity(2), logger::DEBUG);
    EXPECT_EQ(logger::levelFromVerbosity(3), logger::INFO);
    EXPECT_EQ(logger::levelFromVerbosity(4), logger::WARN);
}

TEST(LoggerTests, LevelNames) {
    EXPECT_STREQ(logger::levelToStr(logger::TRACE), "TRACE");
    EXPECT_STREQ(logger::levelToStr(logger::ERROR_L), "ERROR");
}

TEST(LoggerTests, RingRejectsPushWhenFullAndKeepsOrder) {
    logger::LogRing ring(4);
    for (int i = 0; i < 4; ++i) {
        logger::LogMessage msg;
        msg.text = std::to_string(i);
        EXPECT_TRUE(ring.tryPush(std::move(msg)));
    }

    logger::LogMessage overflow;
    EXPECT_FALSE(ring.tryPush(std::move(overflow)));

    logger::LogMessage out;
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(ring.tryPop(out));
        EXPECT_EQ(out.text, std::to_string(i));
    }
    EXPECT_FALSE(ring.tryPop(out));
}

TEST(LoggerTests, RingAcceptsAgainAfterPop) {
    logger::LogRing ring(2);
    logger::LogMessage msg;
    ring.tryPush(logger::LogMessage{});
    ring.tryPush(logger::LogMessage{});
    ASSERT_TRUE(ring.tryPop(msg));
    EXPECT_TRUE(ring.tryPush(logger::LogMessage{}));
}

TEST(LoggerTests, FiltersByLevelAndFormatsMessages) {
    std::ostringstream sink;
    logger::init(logger::INFO, 64, sink);

    SIFINDER_DEBUG("indexer", "hidden detail");
    SIFINDER_INFO("indexer", "hashed ", 42, " files in ", 1.5, " s");
    SIFINDER_WARN("store", "flag=", true);

    logger::shutdown();

    const auto text = sink.str();
    EXPECT_THAT(text, Not(HasSubstr("hidden detail")));
    EXPECT_THAT(text, HasSubstr("[INFO] [indexer] hashed 42 files in 1.5 s"));
    EXPECT_THAT(text, HasSubstr("[WARN] [store] flag=true"));
}

TEST(LoggerTests, MessagesAfterShutdownAreDropped) {
    std::ostringstream sink;
    logger::init(logger::TRACE, 64, sink);
    logger::shutdown();

    SIFINDER_ERROR("late", "nobody hears this");
    EXPECT_TRUE(sink.str().empty());
}

TEST(LoggerTests, ManyThreadsCanLogAtOnce) {
    std::ostringstream sink;
    logger::init(logger::INFO, 4096, sink);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 100; ++i) SIFINDER_INFO("worker", t, ":", i);
        });
    }
    for (auto& th : threads) th.join();

    logger::shutdown();
    EXPECT_THAT(sink.str(), HasSubstr("[worker] 3:99"));
}

TEST(LoggerTests, OverflowIsCountedNotLost) {
    std::ostringstream sink;
    logger::init(logger::INFO, 2, sink);

    for (int i = 0; i < 1000; ++i) SIFINDER_INFO("flood", i);
    logger::shutdown();

    const auto text = sink.str();
    size_t printed = 0;
    for (size_t pos = text.find("[flood]"); pos != std::string::npos; pos = text.find("[flood]", pos + 1)) {
        ++printed;
    }
    EXPECT_EQ(printed + logger::dropped(), 1000u);
    if (logger::dropped() > 0) {
        EXPECT_THAT(text, HasSubstr("dropped, ring full"));
    }
}
