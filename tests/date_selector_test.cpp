#include "date_selector.h"

#include <gtest/gtest.h>

#include <climits>
#include <string>
#include <vector>

namespace {

using Strings = std::vector<std::string>;

TEST(RequiredDaysTest, CeilingOfDailyCapacity) {
    EXPECT_EQ(calculateRequiredDays(0), 0);
    EXPECT_EQ(calculateRequiredDays(-5), 0);
    EXPECT_EQ(calculateRequiredDays(1), 1);
    EXPECT_EQ(calculateRequiredDays(125), 1);
    EXPECT_EQ(calculateRequiredDays(126), 2);
    EXPECT_EQ(calculateRequiredDays(300), 3);
}

TEST(RequiredDaysTest, LargestCountDoesNotOverflow) {
    EXPECT_EQ(calculateRequiredDays(INT_MAX), INT_MAX / 125 + 1);
    EXPECT_EQ(calculateRequiredDays(INT_MAX - INT_MAX % 125), INT_MAX / 125);
}

TEST(RequiredDaysTest, FollowsCapacityProfile) {
    CapacityProfile small;
    small.studentsPerLab = 10;
    small.forenoonCapacity = 5;
    small.afternoonCapacity = 5;
    small.labsPerDay = 2;
    EXPECT_EQ(calculateRequiredDays(41, small), 3);
    EXPECT_EQ(calculateAdditionalDatesNeeded(41, 1, small), 2);
    EXPECT_EQ(calculateAdditionalDatesNeeded(41, 5, small), 0);
}

TEST(SelectOptimalDatesTest, EmptyPool) {
    DateSelection s = selectOptimalDates({}, 100);
    EXPECT_TRUE(s.dates.empty());
    EXPECT_EQ(s.message, "No dates provided");
}

TEST(SelectOptimalDatesTest, NoStudents) {
    DateSelection s = selectOptimalDates({"10-01-25"}, 0);
    EXPECT_TRUE(s.dates.empty());
    EXPECT_EQ(s.message, "No students to schedule");
}

TEST(SelectOptimalDatesTest, NotEnoughDatesReturnsWholePoolSorted) {
    DateSelection s = selectOptimalDates({"12-01-25", "10-01-25"}, 300);
    EXPECT_EQ(s.dates, (Strings{"10-01-25", "12-01-25"}));
    EXPECT_EQ(s.message, "Warning: Only 2 dates available, need 3 for 300 students");
}

TEST(SelectOptimalDatesTest, HugeStudentCountReturnsWholePool) {
    DateSelection s = selectOptimalDates({"11-01-25", "10-01-25"}, INT_MAX, 1);
    EXPECT_EQ(s.dates, (Strings{"10-01-25", "11-01-25"}));
    EXPECT_EQ(s.message, "Warning: Only 2 dates available, need 17179870 for 2147483647 students");
}

TEST(SelectOptimalDatesTest, SingleDayTakesEarliest) {
    DateSelection s = selectOptimalDates({"15-01-25", "10-01-25", "12-01-25"}, 100, 3);
    EXPECT_EQ(s.dates, (Strings{"10-01-25"}));
    EXPECT_EQ(s.message, "Selected 1 date for 100 students");
}

TEST(SelectOptimalDatesTest, RespectsMinimumGap) {
    DateSelection s = selectOptimalDates({"10-01-25", "11-01-25", "15-01-25"}, 200, 3);
    EXPECT_EQ(s.dates, (Strings{"10-01-25", "15-01-25"}));
    EXPECT_EQ(s.message, "Selected 2 dates for 200 students (avg gap: 5.0 days)");
}

TEST(SelectOptimalDatesTest, GapOfOneTakesFirstDates) {
    DateSelection s = selectOptimalDates({"13-01-25", "10-01-25", "11-01-25", "12-01-25"}, 250, 1);
    EXPECT_EQ(s.dates, (Strings{"10-01-25", "11-01-25"}));
    EXPECT_EQ(s.message, "Selected 2 dates for 250 students (avg gap: 1.0 days)");
}

TEST(SelectOptimalDatesTest, RelaxesGapWhenImpossible) {
    DateSelection s = selectOptimalDates({"10-01-25", "11-01-25", "12-01-25"}, 300, 5);
    EXPECT_EQ(s.dates, (Strings{"10-01-25", "11-01-25", "12-01-25"}));
    EXPECT_EQ(s.message, "Selected 3 dates (gap constraint relaxed due to limited dates)");
}

TEST(SelectOptimalDatesTest, AverageGapHasOneDecimal) {
    DateSelection s = selectOptimalDates({"01-03-25", "03-03-25", "08-03-25"}, 300, 2);
    EXPECT_EQ(s.dates, (Strings{"01-03-25", "03-03-25", "08-03-25"}));
    EXPECT_EQ(s.message, "Selected 3 dates for 300 students (avg gap: 3.5 days)");
}

TEST(AutoScheduleDatesTest, PairsSubjectsByPosition) {
    AutoScheduledDates a = autoScheduleDates({"15-01-25", "10-01-25"}, 200, 1, {"Physics"});
    ASSERT_EQ(a.examDates.size(), 2u);
    EXPECT_EQ(a.examDates[0].date, "10-01-25");
    EXPECT_EQ(a.examDates[0].subject, std::optional<std::string>("Physics"));
    EXPECT_EQ(a.examDates[1].date, "15-01-25");
    EXPECT_FALSE(a.examDates[1].subject.has_value());
    EXPECT_TRUE(a.examDates[1].registerNumbers.empty());
}

TEST(CalculateRequirementsTest, WithAvailableDates) {
    CapacityRequirements r = calculateRequirements(300, 2);
    EXPECT_EQ(r.studentCount, 300);
    EXPECT_EQ(r.dailyCapacity, 125);
    EXPECT_EQ(r.requiredDays, 3);
    EXPECT_EQ(r.availableDates, 2);
    ASSERT_TRUE(r.datesSufficient.has_value());
    EXPECT_FALSE(*r.datesSufficient);
    EXPECT_EQ(r.additionalDatesNeeded, std::optional<int>(1));
}

TEST(CalculateRequirementsTest, HugeStudentCount) {
    CapacityRequirements r = calculateRequirements(INT_MAX, 3);
    EXPECT_EQ(r.requiredDays, 17179870);
    ASSERT_TRUE(r.datesSufficient.has_value());
    EXPECT_FALSE(*r.datesSufficient);
    EXPECT_EQ(r.additionalDatesNeeded, std::optional<int>(17179867));
}

TEST(CalculateRequirementsTest, WithoutAvailableDates) {
    CapacityRequirements r = calculateRequirements(50, 0);
    EXPECT_EQ(r.requiredDays, 1);
    EXPECT_FALSE(r.datesSufficient.has_value());
    EXPECT_FALSE(r.additionalDatesNeeded.has_value());
}

}  // namespace
