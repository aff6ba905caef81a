#include "api_json.h"

#include <optional>
#include <string>
#include <vector>

using nlohmann::json;

// --- optional <-> null ---

template <typename T>
static json optionalToJson(const std::optional<T>& v) {
    if (!v.has_value()) return nullptr;
    return json(*v);
}

template <typename T>
static std::optional<T> optionalFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

template <typename T>
static std::vector<T> arrayOrEmpty(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].get<std::vector<T>>();
}

// ==================== модели ====================

void to_json(json& j, const Examiner& e) {
    j = json{{"id", e.id}, {"name", e.name}};
}

void from_json(const json& j, Examiner& e) {
    j.at("id").get_to(e.id);
    j.at("name").get_to(e.name);
}

void to_json(json& j, const Batch& b) {
    j = json{{"name", b.name}, {"register_numbers", b.registerNumbers}};
}

void from_json(const json& j, Batch& b) {
    j.at("name").get_to(b.name);
    b.registerNumbers = arrayOrEmpty<std::string>(j, "register_numbers");
}

void to_json(json& j, const Semester& s) {
    j = json{{"name", s.name}, {"batches", s.batches}};
}

void from_json(const json& j, Semester& s) {
    j.at("name").get_to(s.name);
    s.batches = arrayOrEmpty<Batch>(j, "batches");
}

void to_json(json& j, const ExamMetadata& m) {
    j = json{
        {"exam_name", optionalToJson(m.examName)},
        {"semester", optionalToJson(m.semester)},
        {"department", optionalToJson(m.department)},
        {"academic_year", optionalToJson(m.academicYear)}
    };
}

void from_json(const json& j, ExamMetadata& m) {
    m.examName     = optionalFromJson<std::string>(j, "exam_name");
    m.semester     = optionalFromJson<std::string>(j, "semester");
    m.department   = optionalFromJson<std::string>(j, "department");
    m.academicYear = optionalFromJson<std::string>(j, "academic_year");
}

void to_json(json& j, const ExamDate& d) {
    j = json{
        {"date", d.date},
        {"subject", optionalToJson(d.subject)},
        {"register_numbers", d.registerNumbers}
    };
}

void from_json(const json& j, ExamDate& d) {
    j.at("date").get_to(d.date);
    d.subject = optionalFromJson<std::string>(j, "subject");
    d.registerNumbers = arrayOrEmpty<std::string>(j, "register_numbers");
}

void to_json(json& j, const TimeSlot& t) {
    j = json{
        {"time", t.time},
        {"session", sessionToString(t.session)},
        {"capacity", t.capacity},
        {"register_numbers", t.registerNumbers}
    };
}

void from_json(const json& j, TimeSlot& t) {
    j.at("time").get_to(t.time);
    t.session = sessionFromString(j.at("session").get<std::string>());
    j.at("capacity").get_to(t.capacity);
    t.registerNumbers = arrayOrEmpty<std::string>(j, "register_numbers");
}

void to_json(json& j, const LabSchedule& s) {
    j = json{
        {"date", s.date},
        {"subject", optionalToJson(s.subject)},
        {"lab", s.lab},
        {"slots", s.slots},
        {"internal_examiner", optionalToJson(s.internalExaminer)},
        {"external_examiner", optionalToJson(s.externalExaminer)},
        {"semester", optionalToJson(s.semester)},
        {"batch", optionalToJson(s.batch)}
    };
}

void from_json(const json& j, LabSchedule& s) {
    j.at("date").get_to(s.date);
    s.subject = optionalFromJson<std::string>(j, "subject");
    j.at("lab").get_to(s.lab);
    s.slots = j.at("slots").get<std::vector<TimeSlot>>();
    s.internalExaminer = optionalFromJson<Examiner>(j, "internal_examiner");
    s.externalExaminer = optionalFromJson<Examiner>(j, "external_examiner");
    s.semester = optionalFromJson<std::string>(j, "semester");
    s.batch    = optionalFromJson<std::string>(j, "batch");
}

void to_json(json& j, const ScheduleRequest& r) {
    j = json{
        {"exam_metadata", optionalToJson(r.examMetadata)},
        {"register_numbers", r.registerNumbers},
        {"semesters", r.semesters},
        {"dates", r.dates},
        {"exam_dates", r.examDates},
        {"labs", r.labs},
        {"internal_examiners", r.internalExaminers},
        {"external_examiners", r.externalExaminers}
    };
}

// все поля необязательные
void from_json(const json& j, ScheduleRequest& r) {
    r.examMetadata      = optionalFromJson<ExamMetadata>(j, "exam_metadata");
    r.registerNumbers   = arrayOrEmpty<std::string>(j, "register_numbers");
    r.semesters         = arrayOrEmpty<Semester>(j, "semesters");
    r.dates             = arrayOrEmpty<std::string>(j, "dates");
    r.examDates         = arrayOrEmpty<ExamDate>(j, "exam_dates");
    r.labs              = arrayOrEmpty<std::string>(j, "labs");
    r.internalExaminers = arrayOrEmpty<Examiner>(j, "internal_examiners");
    r.externalExaminers = arrayOrEmpty<Examiner>(j, "external_examiners");
}

void to_json(json& j, const ScheduleResponse& r) {
    j = json{
        {"exam_metadata", optionalToJson(r.examMetadata)},
        {"examiners", r.examiners},
        {"schedule", r.schedule}
    };
}

void from_json(const json& j, ScheduleResponse& r) {
    r.examMetadata = optionalFromJson<ExamMetadata>(j, "exam_metadata");
    r.examiners.clear();
    if (j.contains("examiners") && j["examiners"].is_object()) {
        r.examiners = j["examiners"].get<std::map<std::string, std::vector<Examiner>>>();
    }
    r.schedule = arrayOrEmpty<LabSchedule>(j, "schedule");
}

// ==================== DTO ====================

void to_json(json& j, const ValidationError& e) {
    j = json{{"field", e.field}, {"message", e.message}};
}

void to_json(json& j, const ApiResponse& r) {
    j = json{
        {"success", r.success},
        {"data", optionalToJson(r.data)},
        {"errors", r.errors},
        {"warnings", r.warnings}
    };
}

void to_json(json& j, const ValidateResponse& r) {
    j = json{
        {"success", r.success},
        {"errors", r.errors},
        {"warnings", r.warnings},
        {"summary", {
            {"total_students", r.summary.totalStudents},
            {"duplicates_found", r.summary.duplicatesFound},
            {"dates_provided", r.summary.datesProvided},
            {"labs_provided", r.summary.labsProvided},
            {"internal_examiners", r.summary.internalExaminers},
            {"external_examiners", r.summary.externalExaminers},
            {"semesters", r.summary.semesters}
        }}
    };
}

void to_json(json& j, const AutoSelectResponse& r) {
    j = json{
        {"success", r.success},
        {"selected_dates", r.selectedDates},
        {"exam_dates", r.examDates},
        {"required_days", r.requiredDays},
        {"available_days", r.availableDays},
        {"students_per_day", r.studentsPerDay},
        {"message", r.message},
        {"schedule_info", {
            {"total_students", r.totalStudents},
            {"days_needed", r.requiredDays},
            {"days_selected", r.selectedDates.size()},
            {"min_gap_requested", r.minGapRequested}
        }}
    };
}

void to_json(json& j, const ExtractedData& d) {
    j = json{
        {"exam_name", d.examName},
        {"department", d.department},
        {"semester", d.semester},
        {"batch", d.batch},
        {"academic_year", d.academicYear},
        {"dates", d.dates},
        {"labs", d.labs},
        {"internal_examiners", d.internalExaminers},
        {"external_examiners", d.externalExaminers},
        {"subjects", d.subjects},
        {"register_numbers", d.registerNumbers},
        {"raw_text", d.rawText}
    };
}

void to_json(json& j, const UploadResponse& r) {
    j = json{
        {"success", r.success},
        {"semesters", r.semesters},
        {"total_students", r.totalStudents}
    };
    if (r.success) {
        j["message"] = r.message;
    } else {
        j["error"] = r.error;
    }
    if (r.extractedData.has_value() || r.rawResponse.has_value() || !r.success) {
        j["extracted_data"] = optionalToJson(r.extractedData);
        j["raw_response"]   = optionalToJson(r.rawResponse);
    }
}

void to_json(json& j, const CapacityRequirements& r) {
    j = json{
        {"student_count", r.studentCount},
        {"daily_capacity", r.dailyCapacity},
        {"required_days", r.requiredDays},
        {"available_dates", r.availableDates},
        {"dates_sufficient", optionalToJson(r.datesSufficient)},
        {"additional_dates_needed", optionalToJson(r.additionalDatesNeeded)}
    };
}

// ==================== строки ====================

std::string scheduleToJson(const ScheduleResponse& response) {
    return json(response).dump(2);
}

ScheduleResponse scheduleFromJson(const std::string& text) {
    return json::parse(text).get<ScheduleResponse>();
}

std::string buildApiResponseJsonString(const ApiResponse& resp) {
    return json(resp).dump(2) + "\n";
}
