#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model.h"
#include "validator.h"

// ответ POST /api/schedule/generate
struct ApiResponse {
    bool success = false;
    std::optional<ScheduleResponse> data;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;
};

struct ValidationSummary {
    int totalStudents     = 0;
    int duplicatesFound   = 0;
    int datesProvided     = 0;
    int labsProvided      = 0;
    int internalExaminers = 0;
    int externalExaminers = 0;
    int semesters         = 0;
};

// ответ POST /api/schedule/validate
struct ValidateResponse {
    bool success = false;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;
    ValidationSummary summary;
};

// ответ POST /api/schedule/auto-select-dates
struct AutoSelectResponse {
    bool success = true;
    std::vector<std::string> selectedDates;
    std::vector<ExamDate> examDates;
    int requiredDays    = 0;
    int availableDays   = 0;
    int studentsPerDay  = 0;
    std::string message;
    int minGapRequested = 1;
    int totalStudents   = 0;
};

// данные, извлечённые из ответа модели распознавания
struct ExtractedData {
    std::string examName;
    std::string department;
    std::string semester = "S1";
    std::string batch    = "A";
    std::string academicYear;
    std::vector<std::string> dates;
    std::vector<std::string> labs;
    std::vector<Examiner> internalExaminers;
    std::vector<Examiner> externalExaminers;
    std::vector<std::string> subjects;
    std::vector<std::string> registerNumbers;
    std::string rawText;
};

// ответ /api/upload/parse-file и /api/upload/analyze-image
struct UploadResponse {
    bool success = false;
    std::vector<Semester> semesters;
    int totalStudents = 0;
    std::string message;                       // при success
    std::string error;                         // при !success
    std::optional<ExtractedData> extractedData;
    std::optional<std::string> rawResponse;
};

ScheduleResponse formatScheduleResponse(
    const std::optional<ExamMetadata>& metadata,
    const std::vector<Examiner>& internalExaminers,
    const std::vector<Examiner>& externalExaminers,
    const std::vector<LabSchedule>& schedules
);

// "<prefix>: a, b, ... and N more" (не больше 10 номеров)
std::string buildDuplicateWarning(const std::string& prefix, const std::vector<std::string>& duplicates);

int countStudents(const std::vector<Semester>& semesters);
