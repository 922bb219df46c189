#include <gtest/gtest.h>
#include "droneid/errors.hpp"
#include "droneid/scan/frequency_scanner.hpp"
#include <set>
using namespace droneid::scan;

TEST(FrequencyScanner, StartsScanningOverTheRightBand) {
    FrequencyScanner narrow(true);
    EXPECT_EQ(narrow.state(), ScanState::Scanning);
    EXPECT_FALSE(narrow.locked_frequency().has_value());
    ASSERT_EQ(narrow.channels().size(), 6u);
    EXPECT_DOUBLE_EQ(narrow.channels().front(), 2459.5e6);

    FrequencyScanner wide(false);
    ASSERT_EQ(wide.channels().size(), 16u);
    EXPECT_DOUBLE_EQ(wide.channels()[6], 5721.5e6);
    EXPECT_DOUBLE_EQ(wide.channels().back(), 5831.5e6);

    EXPECT_THROW(FrequencyScanner(std::vector<double>{}), droneid::ConfigurationError);
}

TEST(FrequencyScanner, CursorVisitsEveryChannelOncePerCycle) {
    FrequencyScanner s(false);
    const auto& ch = s.channels();
    for (int cycle = 0; cycle < 3; ++cycle) {
        std::set<double> seen;
        for (size_t i = 0; i < ch.size(); ++i) {
            const double f = s.next_channel();
            EXPECT_DOUBLE_EQ(f, ch[i]);
            seen.insert(f);
        }
        EXPECT_EQ(seen.size(), ch.size());
    }
}

TEST(FrequencyScanner, LockedReturnsLockedFrequencyRegardlessOfCursor) {
    FrequencyScanner s(true);
    s.next_channel();
    s.next_channel();
    s.lock(2429.5e6);
    for (int i = 0; i < 20; ++i) EXPECT_DOUBLE_EQ(s.next_channel(), 2429.5e6);
    EXPECT_EQ(s.cursor(), 2u);
    s.unlock();
    EXPECT_DOUBLE_EQ(s.next_channel(), s.channels()[2]);
}

TEST(FrequencyScanner, NineMissesStayLockedTenthUnlocks) {
    FrequencyScanner s(true);
    s.lock(2444.5e6);
    for (size_t i = 0; i < FrequencyScanner::kUnlockThreshold - 1; ++i) s.record_detection(false);
    EXPECT_EQ(s.state(), ScanState::Locked);
    EXPECT_EQ(s.empty_scan_count(), 9u);
    s.record_detection(false);
    EXPECT_EQ(s.state(), ScanState::Scanning);
    EXPECT_FALSE(s.locked_frequency().has_value());
    EXPECT_EQ(s.empty_scan_count(), 0u);
}

TEST(FrequencyScanner, DetectionResetsTheCounter) {
    FrequencyScanner s(true);
    s.lock(2444.5e6);
    for (int i = 0; i < 8; ++i) s.record_detection(false);
    s.record_detection(true);
    EXPECT_EQ(s.empty_scan_count(), 0u);
    for (int i = 0; i < 9; ++i) s.record_detection(false);
    EXPECT_EQ(s.state(), ScanState::Locked);
    ASSERT_TRUE(s.locked_frequency().has_value());
    EXPECT_DOUBLE_EQ(*s.locked_frequency(), 2444.5e6);
}

TEST(FrequencyScanner, RecordWhileScanningHasNoEffect) {
    FrequencyScanner s(true);
    for (int i = 0; i < 25; ++i) s.record_detection(i % 2 == 0);
    EXPECT_EQ(s.state(), ScanState::Scanning);
    EXPECT_EQ(s.empty_scan_count(), 0u);
}

TEST(FrequencyScanner, RelockResetsCounterAndResetRewindsCursor) {
    FrequencyScanner s(true);
    s.lock(2459.5e6);
    for (int i = 0; i < 5; ++i) s.record_detection(false);
    s.lock(2474.5e6);
    EXPECT_EQ(s.empty_scan_count(), 0u);
    EXPECT_DOUBLE_EQ(*s.locked_frequency(), 2474.5e6);

    s.reset();
    EXPECT_EQ(s.state(), ScanState::Scanning);
    EXPECT_EQ(s.cursor(), 0u);
    s.next_channel();
    s.next_channel();
    s.reset();
    EXPECT_DOUBLE_EQ(s.next_channel(), 2459.5e6);
}

TEST(FrequencyScanner, SampleCountFloors) {
    EXPECT_EQ(FrequencyScanner::sample_count(0.5, 20e6), 10000000u);
    EXPECT_EQ(FrequencyScanner::sample_count(1.3, 50e6), 65000000u);
    EXPECT_EQ(FrequencyScanner::sample_count(1e-6, 1.5e6), 1u);
    EXPECT_EQ(FrequencyScanner::sample_count(0.0, 20e6), 0u);
    EXPECT_STREQ(to_string(ScanState::Locked), "locked");
}
