// generator.cpp
#include "generator.h"

#include "logger.h"

#include <algorithm>
#include <set>
#include <string>

// --- маленькие хелперы ---

std::pair<std::vector<std::string>, std::vector<std::string>> splitIntoSlots(
    const std::vector<std::string>& students,
    const CapacityProfile& profile
) {
    size_t fnEnd = std::min(students.size(), (size_t)profile.forenoonCapacity);
    size_t anEnd = std::min(students.size(), fnEnd + (size_t)profile.afternoonCapacity);

    std::vector<std::string> forenoon(students.begin(), students.begin() + fnEnd);
    std::vector<std::string> afternoon(students.begin() + fnEnd, students.begin() + anEnd);
    return {forenoon, afternoon};
}

TimeSlot createTimeSlot(Session session, const std::vector<std::string>& registerNumbers,
                        const CapacityProfile& profile) {
    TimeSlot slot;
    slot.session = session;
    slot.time = (session == Session::Forenoon) ? profile.forenoonTime : profile.afternoonTime;
    slot.capacity = (int)registerNumbers.size();
    slot.registerNumbers = registerNumbers;
    return slot;
}

LabSchedule createLabSchedule(
    const std::string& date,
    const std::string& lab,
    const std::vector<std::string>& students,
    const CapacityProfile& profile
) {
    auto split = splitIntoSlots(students, profile);

    LabSchedule s;
    s.date = date;
    s.lab  = lab;
    s.slots.push_back(createTimeSlot(Session::Forenoon, split.first, profile));
    s.slots.push_back(createTimeSlot(Session::Afternoon, split.second, profile));
    return s;
}

CohortLookup buildCohortLookup(const std::vector<Semester>& semesters) {
    CohortLookup lookup;
    for (const Semester& sem : semesters) {
        for (const Batch& b : sem.batches) {
            std::string label = sem.batchLabel(b.name);
            for (const std::string& regNo : b.registerNumbers) {
                lookup[regNo] = {sem.name, label};
            }
        }
    }
    return lookup;
}

void assignCohort(LabSchedule& schedule,
                  const std::vector<std::string>& chunk,
                  const CohortLookup& lookup) {
    if (lookup.empty()) return;

    // пары в порядке первого появления, чтобы при равенстве выигрывала первая
    std::vector<std::pair<std::pair<std::string, std::string>, int>> counts;

    for (const std::string& regNo : chunk) {
        auto it = lookup.find(regNo);
        if (it == lookup.end()) continue;

        bool found = false;
        for (auto& c : counts) {
            if (c.first == it->second) {
                c.second++;
                found = true;
                break;
            }
        }
        if (!found) counts.push_back({it->second, 1});
    }

    if (counts.empty()) return;

    size_t best = 0;
    for (size_t i = 1; i < counts.size(); ++i) {
        if (counts[i].second > counts[best].second) best = i;
    }

    schedule.semester = counts[best].first.first;
    schedule.batch    = counts[best].first.second;

    // смешанная пачка: перечисляем все метки
    if (counts.size() > 1) {
        std::set<std::string> labels;
        for (const auto& c : counts) labels.insert(c.first.second);

        std::string joined;
        for (const std::string& l : labels) {
            if (!joined.empty()) joined += ", ";
            joined += l;
        }
        schedule.batch = joined;
    }
}

// Раскладывает students одной даты по лабораториям, по пачке на лабораторию.
// Возвращает, сколько студентов размещено.
static size_t fillDate(
    const std::string& date,
    const std::vector<std::string>& students,
    size_t startIndex,
    const std::vector<std::string>& labs,
    const AllocationOptions& options,
    const CohortLookup& lookup,
    std::vector<LabSchedule>& out
) {
    const CapacityProfile& cap = options.capacity;
    size_t index = startIndex;

    std::optional<std::string> subject;
    auto subjIt = options.dateSubjects.find(date);
    if (subjIt != options.dateSubjects.end()) subject = subjIt->second;

    // за день не больше labsPerDay лабораторий, даже если передано больше
    size_t labCount = std::min(labs.size(), (size_t)cap.labsPerDay);

    for (size_t labIndex = 0; labIndex < labCount; ++labIndex) {
        if (index >= students.size()) break;

        size_t chunkEnd = std::min(index + (size_t)cap.studentsPerLab, students.size());
        std::vector<std::string> chunk(students.begin() + index, students.begin() + chunkEnd);

        LabSchedule s = createLabSchedule(date, labs[labIndex], chunk, cap);
        s.subject = subject;

        if (!options.internalExaminers.empty()) {
            s.internalExaminer = options.internalExaminers[labIndex % options.internalExaminers.size()];
        }
        if (!options.externalExaminers.empty()) {
            s.externalExaminer = options.externalExaminers[labIndex % options.externalExaminers.size()];
        }

        assignCohort(s, chunk, lookup);

        logDebug("Дата " + date + ", " + labs[labIndex] +
                 ": студентов=" + std::to_string(chunk.size()) +
                 " (утро=" + std::to_string(s.slots[0].registerNumbers.size()) +
                 ", после обеда=" + std::to_string(s.slots[1].registerNumbers.size()) + ")");

        out.push_back(s);
        index = chunkEnd;
    }

    return index - startIndex;
}

// ============================================================================
//                              РАСПРЕДЕЛЕНИЕ
// ============================================================================

std::vector<LabSchedule> allocateStudents(
    const std::vector<std::string>& registerNumbers,
    const std::vector<std::string>& dates,
    const std::vector<std::string>& labs,
    const AllocationOptions& options
) {
    logInfo("=== Запуск распределения ===");
    logInfo("Студентов: " + std::to_string(registerNumbers.size()) +
            ", дат: " + std::to_string(dates.size()) +
            ", лабораторий: " + std::to_string(labs.size()) +
            ", внутренних экзаменаторов: " + std::to_string(options.internalExaminers.size()) +
            ", внешних: " + std::to_string(options.externalExaminers.size()));

    std::vector<LabSchedule> schedules;

    if (dates.empty() || labs.empty()) {
        logWarning("Нет дат или лабораторий. Расписание будет пустым.");
        return schedules;
    }

    CohortLookup lookup = buildCohortLookup(options.semesters);

    if (!options.dateRegisterNumbers.empty()) {
        // у каждой даты свой список
        for (const std::string& date : dates) {
            auto it = options.dateRegisterNumbers.find(date);
            if (it == options.dateRegisterNumbers.end()) continue;

            size_t placed = fillDate(date, it->second, 0, labs, options, lookup, schedules);
            if (placed < it->second.size()) {
                logWarning("Дата " + date + ": не хватило лабораторий для " +
                           std::to_string(it->second.size() - placed) + " студентов");
            }
        }
    } else {
        size_t index = 0;
        for (const std::string& date : dates) {
            if (index >= registerNumbers.size()) break;
            index += fillDate(date, registerNumbers, index, labs, options, lookup, schedules);
        }

        if (index < registerNumbers.size()) {
            logWarning("Не хватило дат: не размещено " +
                       std::to_string(registerNumbers.size() - index) + " студентов");
        }
    }

    logInfo("=== Распределение завершено: записей " + std::to_string(schedules.size()) + " ===");
    return schedules;
}

std::vector<std::string> getAllRegisterNumbers(const std::vector<LabSchedule>& schedules) {
    std::vector<std::string> all;
    for (const LabSchedule& s : schedules) {
        for (const TimeSlot& slot : s.slots) {
            all.insert(all.end(), slot.registerNumbers.begin(), slot.registerNumbers.end());
        }
    }
    return all;
}

std::map<std::string, int> countStudentsPerDate(const std::vector<LabSchedule>& schedules) {
    std::map<std::string, int> counts;
    for (const LabSchedule& s : schedules) {
        counts[s.date] += s.totalStudents();
    }
    return counts;
}

std::vector<int> countStudentsPerLab(const std::vector<LabSchedule>& schedules) {
    std::vector<int> counts;
    for (const LabSchedule& s : schedules) counts.push_back(s.totalStudents());
    return counts;
}
