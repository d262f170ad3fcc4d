/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <screenwatch.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "fake_event_source.h"

using namespace ScreenWatch;
using namespace std::chrono_literals;

namespace {
template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = 3000ms)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }

        std::this_thread::sleep_for(5ms);
    }

    return predicate();
}

//!
//! \brief Stands in for the reconciler. Counts runs, can be made slow and can report a given exit code. Tracks
//! whether two runs ever overlapped.
//!
class FakeExecutor : public CommandExecutor
{
public:
    ExecutionResult Run(const std::string& command) override
    {
        if (++m_active > 1) {
            m_overlapped = true;
        }

        {
            std::lock_guard<std::mutex> lock(mtx_run_times);
            m_run_times.push_back(std::chrono::steady_clock::now());
        }

        m_started = true;
        m_last_command = command;

        std::this_thread::sleep_for(m_duration);

        ExecutionResult result;
        result.m_status = ExecutionResult::EXITED;
        result.m_exit_code = m_exit_code;
        result.m_duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(m_duration).count();

        ++m_runs;
        --m_active;

        return result;
    }

    std::chrono::milliseconds m_duration {0};
    int m_exit_code = 0;

    std::atomic<int> m_runs {0};
    std::atomic<int> m_active {0};
    std::atomic<bool> m_started {false};
    std::atomic<bool> m_overlapped {false};
    std::string m_last_command;

    std::mutex mtx_run_times;
    std::vector<std::chrono::steady_clock::time_point> m_run_times;

    std::chrono::steady_clock::time_point FirstRunTime()
    {
        std::lock_guard<std::mutex> lock(mtx_run_times);
        return m_run_times.front();
    }
};

Settings TestSettings(double debounce_seconds = 0.05)
{
    Settings settings;

    settings.m_command = "reconcile-displays";
    settings.m_excluded_desktops = {"gnome", "kde"};
    settings.m_debounce_seconds = debounce_seconds;
    settings.m_wait_for_displays = false;

    return settings;
}
} // anonymous namespace

//!
//! \brief Fixture holding the collaborators of a MonitorLoop. The desktop and display counter are driven from the test.
//!
class MonitorLoopTest : public ::testing::Test
{
protected:
    QueueEventSource m_source;
    FakeExecutor m_executor;

    std::mutex mtx_desktop;
    std::optional<std::string> m_desktop = std::string("sway");

    std::atomic<int> m_connected_displays {1};
    std::atomic<int> m_count_calls {0};

    std::atomic<int> m_fatal_exit_code {-1};

    std::unique_ptr<MonitorLoop> MakeLoop(const Settings& settings)
    {
        return std::make_unique<MonitorLoop>(settings,
                                             m_source,
                                             m_executor,
                                             [this]() {
                                                 std::lock_guard<std::mutex> lock(mtx_desktop);
                                                 return m_desktop;
                                             },
                                             [this]() {
                                                 ++m_count_calls;
                                                 return m_connected_displays.load();
                                             },
                                             [this](int exit_code) { m_fatal_exit_code = exit_code; });
    }

    void SetDesktop(const std::optional<std::string>& desktop)
    {
        std::lock_guard<std::mutex> lock(mtx_desktop);
        m_desktop = desktop;
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(MonitorLoopTest, StartAndStop)
{
    auto loop = MakeLoop(TestSettings());

    EXPECT_EQ(loop->GetState(), MonitorLoop::STARTING);
    ASSERT_TRUE(loop->Start());
    EXPECT_EQ(loop->GetState(), MonitorLoop::RUNNING);
    EXPECT_TRUE(m_source.IsSubscribed());

    loop->Stop();

    EXPECT_EQ(loop->GetState(), MonitorLoop::STOPPED);
    EXPECT_FALSE(m_source.IsSubscribed());

    // Idempotent.
    loop->Stop();
    EXPECT_EQ(loop->GetState(), MonitorLoop::STOPPED);
}

TEST_F(MonitorLoopTest, StartTwiceRefused)
{
    auto loop = MakeLoop(TestSettings());

    ASSERT_TRUE(loop->Start());
    EXPECT_FALSE(loop->Start());
    EXPECT_EQ(m_source.GetSubscribeCount(), 1);
}

TEST_F(MonitorLoopTest, SubscribeFailureStops)
{
    m_source.FailSubscribe();

    auto loop = MakeLoop(TestSettings());

    EXPECT_FALSE(loop->Start());
    EXPECT_EQ(loop->GetState(), MonitorLoop::STOPPED);
    EXPECT_EQ(m_executor.m_runs.load(), 0);
}

TEST_F(MonitorLoopTest, StateToString)
{
    EXPECT_EQ(MonitorLoop::StateToString(MonitorLoop::STARTING), "STARTING");
    EXPECT_EQ(MonitorLoop::StateToString(MonitorLoop::RUNNING), "RUNNING");
    EXPECT_EQ(MonitorLoop::StateToString(MonitorLoop::STOPPING), "STOPPING");
    EXPECT_EQ(MonitorLoop::StateToString(MonitorLoop::STOPPED), "STOPPED");
}

// ============================================================================
// Debounced execution
// ============================================================================

TEST_F(MonitorLoopTest, BurstRunsCommandOnce)
{
    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    std::chrono::steady_clock::time_point last_push;

    for (int i = 0; i < 3; ++i) {
        last_push = std::chrono::steady_clock::now();
        m_source.Push("drm");
        std::this_thread::sleep_for(10ms);
    }

    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));

    // The run happens one debounce delay (50 ms) after the last event, not before and not much later.
    EXPECT_GE(m_executor.FirstRunTime(), last_push + 50ms);
    EXPECT_LT(m_executor.FirstRunTime(), last_push + 50ms + 150ms);

    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(m_executor.m_runs.load(), 1);
    EXPECT_EQ(m_executor.m_last_command, "reconcile-displays");
    EXPECT_EQ(loop->GetEventCount(), 3);
    EXPECT_EQ(loop->GetFireCount(), 1);
    EXPECT_EQ(loop->GetExecutionCount(), 1);

    std::optional<ExecutionResult> last_result = loop->GetLastResult();
    ASSERT_TRUE(last_result.has_value());
    EXPECT_TRUE(last_result->IsSuccess());
}

TEST_F(MonitorLoopTest, NonDisplayEventsNeverRunCommand)
{
    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("usb", DeviceEvent::ADD);
    m_source.Push("input", DeviceEvent::ADD);
    m_source.Push("sound", DeviceEvent::CHANGE);

    ASSERT_TRUE(WaitFor([this]() { return m_source.GetDiscardedEventCount() == 3; }));

    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(m_executor.m_runs.load(), 0);
    EXPECT_EQ(loop->GetEventCount(), 0);
}

TEST_F(MonitorLoopTest, SeparatedEventsRunSeparately)
{
    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));

    m_source.Push("drm", DeviceEvent::REMOVE);
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 2; }));
}

TEST_F(MonitorLoopTest, FailedCommandKeepsRunning)
{
    m_executor.m_exit_code = 1;

    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));

    EXPECT_EQ(loop->GetState(), MonitorLoop::RUNNING);

    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetLastResult().has_value(); }));
    EXPECT_EQ(loop->GetLastResult()->m_exit_code, 1);

    m_source.Push("drm");
    EXPECT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 2; }));
}

TEST_F(MonitorLoopTest, EventsDuringRunCoalesceIntoOneFollowUp)
{
    m_executor.m_duration = 300ms;

    auto loop = MakeLoop(TestSettings(0.02));
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_started.load(); }));

    for (int i = 0; i < 3; ++i) {
        m_source.Push("drm");
        std::this_thread::sleep_for(30ms);
    }

    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 2; }));

    std::this_thread::sleep_for(500ms);

    EXPECT_EQ(m_executor.m_runs.load(), 2);
    EXPECT_FALSE(m_executor.m_overlapped.load());
}

TEST_F(MonitorLoopTest, HugeDebounceDelayIsNotZero)
{
    // Far beyond what std::chrono nanoseconds can hold. The delay saturates instead of wrapping to no debounce.
    auto loop = MakeLoop(TestSettings(1e12));
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetEventCount() == 1; }));

    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(m_executor.m_runs.load(), 0);
    EXPECT_EQ(loop->GetFireCount(), 0);
}

// ============================================================================
// Stop behavior
// ============================================================================

TEST_F(MonitorLoopTest, StopCancelsPendingCountdown)
{
    auto loop = MakeLoop(TestSettings(0.3));
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetEventCount() == 1; }));

    loop->Stop();

    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(m_executor.m_runs.load(), 0);
    EXPECT_EQ(loop->GetState(), MonitorLoop::STOPPED);
}

TEST_F(MonitorLoopTest, StopWaitsForCommandInFlight)
{
    m_executor.m_duration = 300ms;

    auto loop = MakeLoop(TestSettings(0.01));
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_started.load(); }));

    loop->Stop();

    EXPECT_EQ(m_executor.m_runs.load(), 1);
    EXPECT_EQ(m_executor.m_active.load(), 0);
    EXPECT_EQ(loop->GetState(), MonitorLoop::STOPPED);
}

TEST_F(MonitorLoopTest, EventBusLossIsFatal)
{
    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.FailBus();

    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetState() == MonitorLoop::STOPPED; }));
    EXPECT_TRUE(WaitFor([this]() { return m_fatal_exit_code.load() == 1; }));

    loop->Stop();
    EXPECT_EQ(m_executor.m_runs.load(), 0);
}

// ============================================================================
// Desktop exclusion
// ============================================================================

TEST_F(MonitorLoopTest, ExcludedDesktopSuppressesCommand)
{
    SetDesktop(std::string("ubuntu:GNOME"));

    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetFireCount() == 1; }));

    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(m_executor.m_runs.load(), 0);
    EXPECT_EQ(loop->GetExecutionCount(), 0);
    EXPECT_EQ(loop->GetState(), MonitorLoop::RUNNING);
}

TEST_F(MonitorLoopTest, NoDesktopDetectedRunsCommand)
{
    SetDesktop(std::nullopt);

    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    EXPECT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));
}

TEST_F(MonitorLoopTest, DesktopCheckedOnEveryFire)
{
    SetDesktop(std::string("KDE"));

    auto loop = MakeLoop(TestSettings());
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetFireCount() == 1; }));

    SetDesktop(std::string("sway"));

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));
    EXPECT_EQ(loop->GetFireCount(), 2);
}

// ============================================================================
// Display readiness
// ============================================================================

TEST_F(MonitorLoopTest, WaitsForConnectedDisplay)
{
    Settings settings = TestSettings(0.01);
    settings.m_wait_for_displays = true;
    settings.m_display_settle_seconds = 0.0;
    settings.m_display_ready_timeout_seconds = 2.0;
    settings.m_display_poll_interval_ms = 20;

    m_connected_displays = 0;

    auto loop = MakeLoop(settings);
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([this]() { return m_count_calls.load() >= 3; }));

    EXPECT_EQ(m_executor.m_runs.load(), 0);

    m_connected_displays = 1;

    EXPECT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));
}

TEST_F(MonitorLoopTest, DisplayTimeoutStillRunsCommand)
{
    Settings settings = TestSettings(0.01);
    settings.m_wait_for_displays = true;
    settings.m_display_settle_seconds = 0.0;
    settings.m_display_ready_timeout_seconds = 0.1;
    settings.m_display_poll_interval_ms = 20;

    m_connected_displays = 0;

    auto loop = MakeLoop(settings);
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");

    EXPECT_TRUE(WaitFor([this]() { return m_executor.m_runs.load() == 1; }));
}

TEST_F(MonitorLoopTest, StopDuringDisplayWaitSkipsCommand)
{
    Settings settings = TestSettings(0.01);
    settings.m_wait_for_displays = true;
    settings.m_display_settle_seconds = 10.0;

    auto loop = MakeLoop(settings);
    ASSERT_TRUE(loop->Start());

    m_source.Push("drm");
    ASSERT_TRUE(WaitFor([&loop]() { return loop->GetFireCount() == 1; }));

    auto start = std::chrono::steady_clock::now();

    loop->Stop();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(m_executor.m_runs.load(), 0);
}
