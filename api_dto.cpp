#include "api_dto.h"
#include <string>
#include <vector>

ScheduleResponse formatScheduleResponse(
    const std::optional<ExamMetadata>& metadata,
    const std::vector<Examiner>& internalExaminers,
    const std::vector<Examiner>& externalExaminers,
    const std::vector<LabSchedule>& schedules
) {
    ScheduleResponse resp;
    resp.examMetadata = metadata;
    resp.examiners["internal"] = internalExaminers;
    resp.examiners["external"] = externalExaminers;
    resp.schedule = schedules;
    return resp;
}

std::string buildDuplicateWarning(const std::string& prefix, const std::vector<std::string>& duplicates) {
    const size_t kShown = 10;

    std::string msg = prefix + ": ";
    for (size_t i = 0; i < duplicates.size() && i < kShown; ++i) {
        if (i) msg += ", ";
        msg += duplicates[i];
    }
    if (duplicates.size() > kShown) {
        msg += " and " + std::to_string(duplicates.size() - kShown) + " more";
    }
    return msg;
}

int countStudents(const std::vector<Semester>& semesters) {
    int total = 0;
    for (const Semester& s : semesters) {
        for (const Batch& b : s.batches) total += (int)b.registerNumbers.size();
    }
    return total;
}
