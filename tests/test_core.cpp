/**
 * @file test_core.cpp
 * @brief Tests for the event loop, generation counter, errors and logger
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "loanvoice/core/error.h"
#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/generation.h"
#include "loanvoice/core/logger.h"

using namespace loanvoice;
using std::chrono::milliseconds;

// =============================================================================
// EVENT LOOP
// =============================================================================

TEST(EventLoop, RunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    EXPECT_EQ(loop.run_pending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.pending_tasks(), 0u);
}

TEST(EventLoop, TasksPostedWhileDrainingRunInSamePass) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] {
        order.push_back(1);
        loop.post([&] { order.push_back(3); });
    });
    loop.post([&] { order.push_back(2); });

    loop.run_pending();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, DelayedTaskWaitsForItsTime) {
    EventLoop loop;
    int fired = 0;
    loop.post_delayed(milliseconds(1000), [&] { ++fired; });

    loop.run_pending();
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.pending_timers(), 1u);

    loop.advance_time(milliseconds(999));
    loop.run_pending();
    EXPECT_EQ(fired, 0);

    loop.advance_time(milliseconds(1));
    loop.run_pending();
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoop, TimersFireInDueOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post_delayed(milliseconds(300), [&] { order.push_back(3); });
    loop.post_delayed(milliseconds(100), [&] { order.push_back(1); });
    loop.post_delayed(milliseconds(200), [&] { order.push_back(2); });

    loop.advance_time(milliseconds(500));
    loop.run_pending();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, CancelledTimerNeverRuns) {
    EventLoop loop;
    int fired = 0;
    auto id = loop.post_delayed(milliseconds(50), [&] { ++fired; });
    loop.cancel_timer(id);

    loop.advance_time(milliseconds(100));
    loop.run_pending();
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoop, ThrowingTaskDoesNotStopLoop) {
    EventLoop loop;
    Logger::instance().setStderrFallback(false);
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    EXPECT_EQ(loop.run_pending(), 2u);
    EXPECT_TRUE(after);
    Logger::instance().setStderrFallback(true);
}

TEST(EventLoop, RunReturnsAfterStop) {
    EventLoop loop;
    int ran = 0;
    std::thread poster([&] {
        loop.post([&] { ++ran; });
        loop.post([&] { loop.stop(); });
    });

    loop.run();
    poster.join();
    EXPECT_EQ(ran, 1);
    EXPECT_FALSE(loop.is_running());
}

TEST(EventLoop, InLoopThreadOnlyWhileRunning) {
    EventLoop loop;
    bool inside = false;
    loop.post([&] { inside = loop.in_loop_thread(); });
    loop.run_pending();

    EXPECT_TRUE(inside);
    EXPECT_FALSE(loop.in_loop_thread());
}

// =============================================================================
// GENERATION
// =============================================================================

TEST(Generation, AdvanceInvalidatesOlderValues) {
    Generation gen;
    auto first = gen.current();
    EXPECT_TRUE(gen.is_current(first));

    auto second = gen.advance();
    EXPECT_FALSE(gen.is_current(first));
    EXPECT_TRUE(gen.is_current(second));
    EXPECT_GT(second, first);
}

// =============================================================================
// ERRORS
// =============================================================================

TEST(Error, DefaultIsOk) {
    Error error;
    EXPECT_TRUE(error.ok());
    EXPECT_FALSE(static_cast<bool>(error));
    EXPECT_EQ(error.to_string(), "Success");
}

TEST(Error, ToStringCarriesCategory) {
    Error error = make_error(ErrorKind::Permission, "Microphone access denied");
    EXPECT_FALSE(error.ok());
    EXPECT_EQ(error.to_string(), "Permission: Microphone access denied");
}

TEST(Error, Classification) {
    EXPECT_TRUE(is_fatal_to_call_start(ErrorKind::Permission));
    EXPECT_TRUE(is_fatal_to_call_start(ErrorKind::Device));
    EXPECT_FALSE(is_fatal_to_call_start(ErrorKind::Transport));

    EXPECT_TRUE(is_user_actionable(ErrorKind::Server));
    EXPECT_TRUE(is_user_actionable(ErrorKind::Session));
    EXPECT_FALSE(is_user_actionable(ErrorKind::Decode));
    EXPECT_FALSE(is_user_actionable(ErrorKind::Protocol));
}

// =============================================================================
// LOGGER
// =============================================================================

namespace {

struct CapturedLog {
    std::vector<std::string> lines;
};

void capture_log(LogLevel level, const char* category, const char* message, void* user_data) {
    auto* captured = static_cast<CapturedLog*>(user_data);
    captured->lines.push_back(std::string(log_level_name(level)) + " " + category + " " + message);
}

}  // namespace

TEST(Logger, ParseLevelNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::Warning);
}

TEST(Logger, CallbackReceivesFormattedMessagesAboveMinLevel) {
    CapturedLog captured;
    Logger& logger = Logger::instance();
    LogLevel previous = logger.minLevel();
    logger.setCallback(capture_log, &captured);
    logger.setMinLevel(LogLevel::Info);

    LV_LOG_DEBUG("Test", "hidden %d", 1);
    LV_LOG_INFO("Test", "shown %d", 2);

    logger.setCallback(nullptr);
    logger.setMinLevel(previous);

    ASSERT_EQ(captured.lines.size(), 1u);
    EXPECT_EQ(captured.lines[0], "INFO Test shown 2");
}
