#include "Timebase.h"
#include <gtest/gtest.h>

TEST(TimebaseTest, TableIsSortedAndComplete) {
    const QVector<Timebase> &table = timebaseTable();
    ASSERT_EQ(table.size(), 32);
    EXPECT_STREQ(table.first().scpi, "5ns");
    EXPECT_STREQ(table.last().scpi, "100s");
    for (int i = 1; i < table.size(); ++i)
        EXPECT_LT(table[i - 1].seconds, table[i].seconds);
}

TEST(TimebaseTest, ShowsAboutTwoPeriods) {
    // 1500 Hz: 2 periods over 10 div = 133 us/div.
    EXPECT_STREQ(optimalTimebaseForFrequency(1500.0).scpi, "200us");
    // 30 Hz: 6.7 ms/div.
    EXPECT_STREQ(optimalTimebaseForFrequency(30.0).scpi, "10ms");
    EXPECT_STREQ(optimalTimebaseForFrequency(7e6).scpi, "50ns");
}

TEST(TimebaseTest, SelectionIsSmallestNotBelowIdeal) {
    for (double f : {0.7, 3.3, 47.0, 1234.5, 98765.0, 2.5e6}) {
        const double ideal = 2.0 / f / SCOPE_HORIZONTAL_DIVISIONS;
        const Timebase &tb = optimalTimebaseForFrequency(f);
        EXPECT_GE(tb.seconds, ideal) << f;
        for (const Timebase &other : timebaseTable()) {
            if (other.seconds >= ideal)
                EXPECT_GE(other.seconds, tb.seconds) << f;
        }
    }
}

TEST(TimebaseTest, ClampsAtBothEnds) {
    EXPECT_STREQ(optimalTimebaseForFrequency(1e12).scpi, "5ns");
    EXPECT_STREQ(optimalTimebaseForFrequency(1e-4).scpi, "100s");
}

TEST(TimebaseTest, NonPositiveFrequencySelectsOneSecond) {
    EXPECT_STREQ(optimalTimebaseForFrequency(0.0).scpi, "1s");
    EXPECT_STREQ(optimalTimebaseForFrequency(-5.0).scpi, "1s");
}

TEST(TimebaseTest, ResolutionDrivesCaptureWindow) {
    EXPECT_STREQ(timebaseForResolution(100.0).scpi, "1ms");
    EXPECT_STREQ(timebaseForResolution(30.0).scpi, "5ms");
    EXPECT_STREQ(timebaseForResolution(1e-4).scpi, "100s");
}
