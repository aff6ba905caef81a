#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "model.h"

struct AllocationOptions {
    std::vector<Examiner> internalExaminers;
    std::vector<Examiner> externalExaminers;
    std::vector<Semester> semesters;
    std::map<std::string, std::string> dateSubjects;                      // дата -> предмет
    std::map<std::string, std::vector<std::string>> dateRegisterNumbers;  // дата -> свои студенты
    CapacityProfile capacity;
};

// Распределение студентов по датам, лабораториям и сменам.
// Без dateRegisterNumbers список идёт подряд: дата -> лаборатория -> пачка
// по studentsPerLab. С ним каждая дата берёт студентов из своего списка.
std::vector<LabSchedule> allocateStudents(
    const std::vector<std::string>& registerNumbers,
    const std::vector<std::string>& dates,
    const std::vector<std::string>& labs,
    const AllocationOptions& options = AllocationOptions{}
);

// первые forenoonCapacity -> утро, остальные (до afternoonCapacity) -> после обеда
std::pair<std::vector<std::string>, std::vector<std::string>> splitIntoSlots(
    const std::vector<std::string>& students,
    const CapacityProfile& profile = CapacityProfile{}
);

TimeSlot createTimeSlot(Session session, const std::vector<std::string>& registerNumbers,
                        const CapacityProfile& profile = CapacityProfile{});

LabSchedule createLabSchedule(
    const std::string& date,
    const std::string& lab,
    const std::vector<std::string>& students,
    const CapacityProfile& profile = CapacityProfile{}
);

// регистрационный номер -> (семестр, метка "S1A")
using CohortLookup = std::map<std::string, std::pair<std::string, std::string>>;

CohortLookup buildCohortLookup(const std::vector<Semester>& semesters);

// Самая частая пара (семестр, метка); при нескольких парах batch = "S1A, S1B".
void assignCohort(LabSchedule& schedule,
                  const std::vector<std::string>& chunk,
                  const CohortLookup& lookup);

// --- вспомогательные выборки по готовому расписанию ---
std::vector<std::string> getAllRegisterNumbers(const std::vector<LabSchedule>& schedules);
std::map<std::string, int> countStudentsPerDate(const std::vector<LabSchedule>& schedules);
std::vector<int> countStudentsPerLab(const std::vector<LabSchedule>& schedules);
