#include "api_json.h"

#include "generator.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace {

using nlohmann::json;

TEST(ScheduleRequestJsonTest, ParsesAllFormats) {
    json j = json::parse(R"({
        "exam_metadata": {"exam_name": "Practical", "semester": null},
        "register_numbers": ["R1"],
        "semesters": [{"name": "S1", "batches": [{"name": "A", "register_numbers": ["R2", "R3"]}]}],
        "exam_dates": [{"date": "10-01-25", "subject": "Physics", "register_numbers": ["R4"]},
                       {"date": "11-01-25"}],
        "labs": ["Lab 1"],
        "internal_examiners": [{"id": "I1", "name": "Asha"}]
    })");

    ScheduleRequest r = j.get<ScheduleRequest>();
    ASSERT_TRUE(r.examMetadata.has_value());
    EXPECT_EQ(r.examMetadata->examName, std::optional<std::string>("Practical"));
    EXPECT_FALSE(r.examMetadata->semester.has_value());
    EXPECT_FALSE(r.examMetadata->department.has_value());

    EXPECT_EQ(r.registerNumbers, (std::vector<std::string>{"R1"}));
    ASSERT_EQ(r.semesters.size(), 1u);
    EXPECT_EQ(r.semesters[0].batches[0].registerNumbers.size(), 2u);
    ASSERT_EQ(r.examDates.size(), 2u);
    EXPECT_EQ(r.examDates[0].subject, std::optional<std::string>("Physics"));
    EXPECT_TRUE(r.examDates[1].registerNumbers.empty());
    EXPECT_TRUE(r.dates.empty());
    EXPECT_TRUE(r.externalExaminers.empty());

    // exam_dates побеждают остальные форматы
    EXPECT_EQ(r.allRegisterNumbers(), (std::vector<std::string>{"R4"}));
    EXPECT_EQ(r.allDates(), (std::vector<std::string>{"10-01-25", "11-01-25"}));
    EXPECT_EQ(r.subjectForDate("10-01-25"), std::optional<std::string>("Physics"));
}

TEST(ScheduleRequestJsonTest, EmptyObjectIsValid) {
    ScheduleRequest r = json::object().get<ScheduleRequest>();
    EXPECT_FALSE(r.examMetadata.has_value());
    EXPECT_TRUE(r.allRegisterNumbers().empty());
    EXPECT_TRUE(r.allDates().empty());
}

TEST(ScheduleRequestJsonTest, ExaminerWithoutIdIsRejected) {
    json j = json::parse(R"({"internal_examiners": [{"name": "Asha"}]})");
    EXPECT_THROW(j.get<ScheduleRequest>(), json::exception);
}

TEST(ScheduleResponseJsonTest, WireShape) {
    ScheduleResponse resp;
    resp.examiners["internal"] = {{"I1", "Asha"}};
    resp.examiners["external"] = {};
    resp.schedule = {createLabSchedule("10-01-25", "Lab 1", {"R1", "R2"})};
    resp.schedule[0].internalExaminer = Examiner{"I1", "Asha"};

    json j = resp;
    EXPECT_TRUE(j["exam_metadata"].is_null());
    EXPECT_EQ(j["examiners"]["internal"][0]["name"], "Asha");

    const json& entry = j["schedule"][0];
    EXPECT_EQ(entry["date"], "10-01-25");
    EXPECT_TRUE(entry["subject"].is_null());
    EXPECT_EQ(entry["internal_examiner"]["id"], "I1");
    EXPECT_TRUE(entry["external_examiner"].is_null());
    EXPECT_TRUE(entry["semester"].is_null());
    EXPECT_EQ(entry["slots"][0]["session"], "forenoon");
    EXPECT_EQ(entry["slots"][0]["capacity"], 2);
    EXPECT_EQ(entry["slots"][1]["session"], "afternoon");
    EXPECT_EQ(entry["slots"][1]["register_numbers"], json::array());
}

TEST(ScheduleResponseJsonTest, TextRoundTripKeepsSchedule) {
    ScheduleResponse resp;
    ExamMetadata meta;
    meta.department = "CSE";
    resp.examMetadata = meta;
    resp.schedule = {createLabSchedule("10-01-25", "Lab 2", {"R1", "R2", "R3"})};
    resp.schedule[0].batch = "S1A, S1B";

    ScheduleResponse back = scheduleFromJson(scheduleToJson(resp));
    ASSERT_TRUE(back.examMetadata.has_value());
    EXPECT_EQ(back.examMetadata->department, std::optional<std::string>("CSE"));
    ASSERT_EQ(back.schedule.size(), 1u);
    EXPECT_EQ(back.schedule[0].lab, "Lab 2");
    EXPECT_EQ(back.schedule[0].batch, std::optional<std::string>("S1A, S1B"));
    EXPECT_EQ(back.schedule[0].slots[0].registerNumbers, resp.schedule[0].slots[0].registerNumbers);
}

TEST(TimeSlotJsonTest, UnknownSessionThrows) {
    json j = {{"time", "x"}, {"session", "evening"}, {"capacity", 0}};
    EXPECT_THROW(j.get<TimeSlot>(), std::invalid_argument);
}

TEST(ApiResponseJsonTest, FailureHasNullData) {
    ApiResponse resp;
    resp.success = false;
    resp.errors.push_back({"dates", "Invalid date format: x. Expected DD-MM-YY"});

    json j = json::parse(buildApiResponseJsonString(resp));
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["data"].is_null());
    EXPECT_EQ(j["errors"][0]["field"], "dates");
    EXPECT_EQ(j["warnings"], json::array());
}

TEST(UploadResponseJsonTest, SuccessAndFailureKeys) {
    UploadResponse ok;
    ok.success = true;
    ok.message = "Extracted 0 register numbers from 0 semester(s)";
    json jo = ok;
    EXPECT_TRUE(jo.contains("message"));
    EXPECT_FALSE(jo.contains("error"));
    EXPECT_FALSE(jo.contains("extracted_data"));

    UploadResponse failed;
    failed.error = "boom";
    json jf = failed;
    EXPECT_EQ(jf["error"], "boom");
    EXPECT_TRUE(jf["extracted_data"].is_null());
    EXPECT_TRUE(jf["raw_response"].is_null());
}

TEST(CapacityRequirementsJsonTest, OptionalFieldsAreNull) {
    json j = calculateRequirements(10, 0);
    EXPECT_EQ(j["daily_capacity"], 125);
    EXPECT_TRUE(j["dates_sufficient"].is_null());
    EXPECT_TRUE(j["additional_dates_needed"].is_null());

    json k = calculateRequirements(10, 1);
    EXPECT_TRUE(k["dates_sufficient"].get<bool>());
    EXPECT_EQ(k["additional_dates_needed"], 0);
}

}  // namespace
