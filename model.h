#include <map>
#include <optional>
#include <string>
#include <vector>

#pragma once

// --- ёмкость лабораторий ---
struct CapacityProfile {
    int studentsPerLab    = 25;
    int forenoonCapacity  = 13;
    int afternoonCapacity = 12;
    int labsPerDay        = 5;

    std::string forenoonTime  = "09:30 am - 12:30 pm";
    std::string afternoonTime = "01:30 pm - 04:30 pm";

    int dailyCapacity() const { return studentsPerLab * labsPerDay; }
};

struct Examiner {
    std::string id;
    std::string name;

    // "ID: Name"
    std::string toString() const;
    // бросает std::invalid_argument, если нет разделителя ": "
    static Examiner fromString(const std::string& s);
};

bool operator==(const Examiner& a, const Examiner& b);

struct Batch {
    std::string name;                          // "A", "B"
    std::vector<std::string> registerNumbers;
};

struct Semester {
    std::string name;                          // "S1", "S2"
    std::vector<Batch> batches;

    std::vector<std::string> allRegisterNumbers() const;
    std::string batchLabel(const std::string& batchName) const { return name + batchName; }
};

struct ExamMetadata {
    std::optional<std::string> examName;
    std::optional<std::string> semester;
    std::optional<std::string> department;
    std::optional<std::string> academicYear;
};

struct ExamDate {
    std::string date;                          // "05-09-25"
    std::optional<std::string> subject;
    std::vector<std::string> registerNumbers;
};

enum class Session {
    Forenoon,
    Afternoon
};

std::string sessionToString(Session s);
Session sessionFromString(const std::string& s);

struct TimeSlot {
    std::string time;
    Session session;
    int capacity;                              // = registerNumbers.size()
    std::vector<std::string> registerNumbers;
};

struct LabSchedule {
    std::string date;
    std::optional<std::string> subject;
    std::string lab;
    std::vector<TimeSlot> slots;               // всегда два: forenoon, afternoon
    std::optional<Examiner> internalExaminer;
    std::optional<Examiner> externalExaminer;
    std::optional<std::string> semester;
    std::optional<std::string> batch;          // "S1A" или "S1A, S1B"

    int totalStudents() const;
};

struct ScheduleRequest {
    std::optional<ExamMetadata> examMetadata;
    std::vector<std::string> registerNumbers;  // старый плоский формат
    std::vector<Semester> semesters;
    std::vector<std::string> dates;            // старый формат дат
    std::vector<ExamDate> examDates;
    std::vector<std::string> labs;
    std::vector<Examiner> internalExaminers;
    std::vector<Examiner> externalExaminers;

    // exam_dates -> semesters -> register_numbers, по приоритету
    std::vector<std::string> allRegisterNumbers() const;
    std::vector<std::string> allDates() const;
    std::optional<std::string> subjectForDate(const std::string& date) const;
};

struct ScheduleResponse {
    std::optional<ExamMetadata> examMetadata;
    std::map<std::string, std::vector<Examiner>> examiners;   // "internal" / "external"
    std::vector<LabSchedule> schedule;
};
