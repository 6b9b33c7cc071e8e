#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

using fdup::infra::ProgressEvent;
using fdup::infra::ProgressMonitor;

TEST(ProgressMonitorTest, KeepsHighestCurrentFromOutOfOrderEvents)
{
    ProgressMonitor monitor{false};
    monitor.on_start(10);
    monitor.on_progress(ProgressEvent{.current = 3, .total = 10, .rate = 1.5});
    monitor.on_progress(ProgressEvent{.current = 2, .total = 10, .rate = 1.0});

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.total, 10u);
    EXPECT_EQ(stats.current, 3u);
    monitor.on_finish();
}

TEST(ProgressMonitorTest, QuietDisablesRendering)
{
    ProgressMonitor monitor{true, true};
    EXPECT_FALSE(monitor.is_enabled());
}

TEST(ProgressMonitorTest, StartResetsCounters)
{
    ProgressMonitor monitor{false};
    monitor.on_start(5);
    monitor.on_progress(ProgressEvent{.current = 5, .total = 5, .rate = 10.0});
    monitor.on_finish();

    monitor.on_start(7);
    EXPECT_EQ(monitor.get_stats().current, 0u);
    EXPECT_EQ(monitor.get_stats().total, 7u);
}
