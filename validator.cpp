#include "validator.h"
#include "date_selector.h"
#include "logger.h"
#include "parsers.h"

const std::vector<std::string>& defaultLabs() {
    static const std::vector<std::string> labs = {"Lab 1", "Lab 2", "Lab 3", "Lab 4", "Lab 5"};
    return labs;
}

void ScheduleValidator::checkRegisterNumbers(
    const std::vector<std::string>& registerNumbers,
    ValidationResult& result
) const {
    if (registerNumbers.empty()) {
        result.ok = false;
        result.errors.push_back({
            "register_numbers",
            "At least one register number is required to generate a schedule"
        });
        logError("[RegisterNumbers] пустой список студентов");
    }
}

void ScheduleValidator::checkLabs(
    const std::vector<std::string>& labs,
    ValidationResult& result
) const {
    if (labs.empty()) {
        result.labsToUse = defaultLabs();
        result.warnings.push_back("Using default labs: " + formatDates(defaultLabs()));
        return;
    }
    // любое количество лабораторий допустимо
    result.labsToUse = labs;
}

void ScheduleValidator::checkExaminers(
    const std::vector<Examiner>& internalExaminers,
    const std::vector<Examiner>& externalExaminers,
    ValidationResult& result
) const {
    if (internalExaminers.empty()) {
        result.warnings.push_back(
            "No internal examiners provided. Schedule will be generated without examiner assignments.");
    }
    if (externalExaminers.empty()) {
        result.warnings.push_back(
            "No external examiners provided. Schedule will be generated without examiner assignments.");
    }
}

void ScheduleValidator::checkDates(
    const std::vector<std::string>& dates,
    int studentCount,
    ValidationResult& result
) const {
    if (dates.empty()) {
        result.warnings.push_back("No dates provided. Please add exam dates for scheduling.");
        return;
    }

    // достаточно первой неверной даты
    for (const std::string& d : dates) {
        if (!parseExamDate(d)) {
            result.ok = false;
            std::string msg = "Invalid date format: " + d + ". Expected DD-MM-YY";
            result.errors.push_back({"dates", msg});
            logError("[DateFormat] " + msg);
            return;
        }
    }

    int additional = calculateAdditionalDatesNeeded(studentCount, (int)dates.size(), capacity_);
    if (additional > 0) {
        int required = calculateRequiredDays(studentCount, capacity_);
        std::string msg = "Note: " + std::to_string(studentCount) +
                          " students may need " + std::to_string(required) +
                          " dates. You provided " + std::to_string(dates.size()) + ".";
        result.warnings.push_back(msg);
        logWarning("[DateCapacity] " + msg);
    }
}

ValidationResult ScheduleValidator::checkAll(const ScheduleRequest& request) const {
    ValidationResult result;
    result.ok = true;

    logInfo("=== Запуск проверки запроса ===");
    logInfo("Студентов: " + std::to_string(request.registerNumbers.size()) +
            ", дат: " + std::to_string(request.dates.size()) +
            ", лабораторий: " + std::to_string(request.labs.size()) +
            ", семестров: " + std::to_string(request.semesters.size()));

    checkRegisterNumbers(request.registerNumbers, result);
    checkLabs(request.labs, result);
    checkExaminers(request.internalExaminers, request.externalExaminers, result);

    if (!request.registerNumbers.empty()) {
        checkDates(request.dates, (int)request.registerNumbers.size(), result);
    }

    if (result.ok) {
        logInfo("Проверка завершена: ошибок нет, предупреждений = " +
                std::to_string(result.warnings.size()));
    } else {
        logWarning("Проверка завершена: обнаружено ошибок = " +
                   std::to_string(result.errors.size()));
    }

    return result;
}

std::vector<std::string> ScheduleValidator::checkScheduleStructure(const ScheduleResponse& response) const {
    std::vector<std::string> errors;

    for (size_t i = 0; i < response.schedule.size(); ++i) {
        const LabSchedule& s = response.schedule[i];
        std::string prefix = "schedule[" + std::to_string(i) + "]";

        if (s.date.empty()) errors.push_back("Missing " + prefix + ".date");
        if (s.lab.empty())  errors.push_back("Missing " + prefix + ".lab");

        if (s.slots.size() != 2) {
            errors.push_back(prefix + " should have exactly 2 slots");
            continue;
        }

        for (size_t j = 0; j < s.slots.size(); ++j) {
            const TimeSlot& slot = s.slots[j];
            if (slot.time.empty()) {
                errors.push_back("Missing " + prefix + ".slots[" + std::to_string(j) + "].time");
            }
            if (slot.capacity != (int)slot.registerNumbers.size()) {
                errors.push_back(prefix + ".slots[" + std::to_string(j) +
                                 "].capacity does not match register_numbers");
            }
        }

        if (s.slots[0].session != Session::Forenoon || s.slots[1].session != Session::Afternoon) {
            errors.push_back(prefix + " slots must be forenoon then afternoon");
        }
        if (s.totalStudents() > capacity_.studentsPerLab) {
            errors.push_back(prefix + " exceeds lab capacity of " +
                             std::to_string(capacity_.studentsPerLab));
        }
    }

    return errors;
}
