#include "model.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

TEST(ExaminerTest, ToStringJoinsIdAndName) {
    EXPECT_EQ((Examiner{"I101", "Dr. Asha"}).toString(), "I101: Dr. Asha");
}

TEST(ExaminerTest, FromStringReadsBackToString) {
    const Examiner e{"EXT2", "Prof. Binu Raj"};
    EXPECT_EQ(Examiner::fromString(e.toString()), e);
}

TEST(ExaminerTest, FromStringSplitsAtFirstSeparator) {
    Examiner e = Examiner::fromString("E1: Dr. X: Visiting");
    EXPECT_EQ(e.id, "E1");
    EXPECT_EQ(e.name, "Dr. X: Visiting");
}

TEST(ExaminerTest, FromStringWithoutSeparatorThrows) {
    EXPECT_THROW(Examiner::fromString("Dr. Asha"), std::invalid_argument);
    EXPECT_THROW(Examiner::fromString("I101:Dr. Asha"), std::invalid_argument);
}

}  // namespace
