#include "unit-tests.hpp"

#include <atomic>
#include <thread>

using namespace pst;
using namespace pst::tests;

TEST_F(UnitTest, Native_RunProcess_CapturesOutputAndExitCode)
{
    const auto [exit_code, output] = native::runProcess("sh", {"-c", "printf hello; exit 3"});
    EXPECT_EQ(exit_code, 3);
    EXPECT_EQ(output, "hello");

    EXPECT_EQ(native::runProcess("pir-state-no-such-binary").first, 127);
}

TEST_F(UnitTest, Native_RunProcess_ShortChildrenNotHeldOpenByLongOnes)
{
    using namespace std::chrono_literals;

    std::atomic<bool> stop{false};
    std::vector<std::thread> sleepers;
    for(int i = 0; i < 6; ++i)
    {
        sleepers.emplace_back([&stop]()
        {
            while(!stop.load())
            {
                const auto res = native::runProcess("sleep", {"1"});
                EXPECT_EQ(res.first, 0);
            }
        });
    }

    std::atomic<long long> slowest_ms{0};
    std::vector<std::thread> runners;
    for(int i = 0; i < 4; ++i)
    {
        runners.emplace_back([&slowest_ms]()
        {
            for(int n = 0; n < 25; ++n)
            {
                const auto start = std::chrono::steady_clock::now();
                const auto res = native::runProcess("true");
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
                EXPECT_EQ(res.first, 0);

                long long current = slowest_ms.load();
                while(elapsed > current && !slowest_ms.compare_exchange_weak(current, elapsed))
                {
                }
            }
        });
    }

    for(std::thread & runner : runners)
    {
        runner.join();
    }
    stop = true;
    for(std::thread & sleeper : sleepers)
    {
        sleeper.join();
    }

    // a leaked pipe end would keep a short call waiting for a one second sleeper
    EXPECT_LT(slowest_ms.load(), 900);
}

TEST_F(UnitTest, Native_SyncPath_FilesAndDirectories)
{
    const auto dir = makeTempPath("native_sync");
    const auto path = dir / "data.bin";
    ASSERT_TRUE(file::writeFileAtomic(path, std::string("x")).has_value());

    EXPECT_TRUE(native::syncPath(path));
    EXPECT_TRUE(native::syncPath(dir));
    EXPECT_FALSE(native::syncPath(dir / "missing"));
}
