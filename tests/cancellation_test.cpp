#include <common/cancellation.hpp>
#include <common/runners.h>

#include <atomic>
#include <chrono> // IWYU pragma: keep
#include <thread>

#include <gtest/gtest.h>

namespace Testing {

using namespace utility;
using namespace std::chrono_literals;

class CancellationTest : public ::testing::Test
{
  public:
};

TEST_F(CancellationTest, FreshSourceIsNotCancelled)
{
    const CCancellationSource source;
    EXPECT_FALSE(source.IsCancellationRequested());
    EXPECT_FALSE(source.Token().IsCancellationRequested());
}

TEST_F(CancellationTest, OnlyFirstCancelCounts)
{
    CCancellationSource source;
    const auto token = source.Token();

    EXPECT_TRUE(source.Cancel());
    EXPECT_FALSE(source.Cancel());
    EXPECT_FALSE(source.Cancel());

    EXPECT_TRUE(source.IsCancellationRequested());
    EXPECT_TRUE(token.IsCancellationRequested());
}

TEST_F(CancellationTest, CallbacksAreCalledOnce)
{
    CCancellationSource source;
    const auto token = source.Token();
    int called = 0;
    token.OnCancellationRequested([&called]() {
        ++called;
    });
    token.OnCancellationRequested([&called]() {
        ++called;
    });

    EXPECT_EQ(called, 0);
    source.Cancel();
    EXPECT_EQ(called, 2);
    source.Cancel();
    EXPECT_EQ(called, 2);
}

TEST_F(CancellationTest, LateCallbackIsCalledImmediately)
{
    CCancellationSource source;
    source.Cancel();

    bool called = false;
    source.Token().OnCancellationRequested([&called]() {
        called = true;
    });
    EXPECT_TRUE(called);
}

TEST_F(CancellationTest, TokenCopiesShareState)
{
    CCancellationSource source;
    const auto token = source.Token();
    const auto copy = token; // NOLINT

    source.Cancel();
    EXPECT_TRUE(copy.IsCancellationRequested());
}

TEST_F(CancellationTest, TokenStopsWorkerThread)
{
    CCancellationSource source;
    std::atomic<int> iterations{0};

    auto runner = startNewRunner([token = source.Token(), &iterations](const auto &shouldStop) {
        while (!isInterrupted(shouldStop) && !token.IsCancellationRequested())
        {
            ++iterations;
            std::this_thread::sleep_for(5ms); // NOLINT
        }
    });

    std::this_thread::sleep_for(50ms); // NOLINT
    source.Cancel();
    const auto started_at = std::chrono::steady_clock::now();
    runner.reset();

    EXPECT_GT(iterations.load(), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - started_at, 500ms); // NOLINT
}

} // namespace Testing
