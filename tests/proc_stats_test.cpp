#include <gtest/gtest.h>

#include <boost/process.hpp>
#include <climits>
#include <unistd.h>

#include <algorithm>
#include <thread>

#include "sandbox/proc_stats.hpp"
#include "sandbox/resource_monitor.hpp"
#include "test_support.hpp"

namespace runbox::sandbox {
namespace {

namespace bp = boost::process;

TEST(ProcStatsTest, ReadsOwnProcess) {
    const auto sample = ReadProcessSample(::getpid());
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->pid, ::getpid());
    EXPECT_EQ(sample->pgrp, ::getpgrp());
    EXPECT_GT(sample->rss_bytes, 0U);
    EXPECT_GE(sample->threads, 1);
    EXPECT_NE(sample->state, 'Z');
}

TEST(ProcStatsTest, MissingProcessIsNullopt) {
    EXPECT_FALSE(ReadProcessSample(INT_MAX).has_value());
}

TEST(ProcStatsTest, ProcessGroupContainsSelf) {
    const auto members = ListProcessGroup(::getpgrp());
    const bool found = std::any_of(members.begin(), members.end(),
                                   [](const ProcessSample& s) { return s.pid == ::getpid(); });
    EXPECT_TRUE(found);
}

TEST(ProcStatsTest, SystemSnapshotIsPlausible) {
    const auto snapshot = ReadSystemSnapshot("/");
    EXPECT_GE(snapshot.cpu_count, 1);
    EXPECT_GT(snapshot.memory_total_mb, 0.0);
    EXPECT_GE(snapshot.memory_percent, 0.0);
    EXPECT_LE(snapshot.memory_percent, 100.0);
    EXPECT_GT(ClockTicksPerSecond(), 0);
}

TEST(ResourceMonitorTest, ReturnsImmediatelyForMissingProcess) {
    ResourceMonitor::Run(INT_MAX, "missing", std::chrono::milliseconds(10));
}

TEST(ResourceMonitorTest, StopsOnceTheLeaderExits) {
    if (!testing::HasCommand("sleep")) {
        GTEST_SKIP() << "sleep not available";
    }
    bp::child child(bp::search_path("sleep"), "0.3");
    // Reaped by a waiter thread so the monitor sees the pid disappear.
    std::thread waiter([&child] { child.wait(); });
    ResourceMonitor::Run(child.id(), "sleeper", std::chrono::milliseconds(20));
    waiter.join();
    EXPECT_FALSE(child.running());
}

}  // namespace
}  // namespace runbox::sandbox
