#include "model.h"

#include <stdexcept>

std::string Examiner::toString() const {
    return id + ": " + name;
}

Examiner Examiner::fromString(const std::string& s) {
    size_t pos = s.find(": ");
    if (pos == std::string::npos) {
        throw std::invalid_argument("Invalid examiner format: " + s);
    }
    return Examiner{s.substr(0, pos), s.substr(pos + 2)};
}

bool operator==(const Examiner& a, const Examiner& b) {
    return a.id == b.id && a.name == b.name;
}

std::vector<std::string> Semester::allRegisterNumbers() const {
    std::vector<std::string> all;
    for (const Batch& b : batches) {
        all.insert(all.end(), b.registerNumbers.begin(), b.registerNumbers.end());
    }
    return all;
}

std::string sessionToString(Session s) {
    switch (s) {
        case Session::Forenoon:  return "forenoon";
        case Session::Afternoon: return "afternoon";
    }
    return "forenoon";
}

Session sessionFromString(const std::string& s) {
    if (s == "forenoon")  return Session::Forenoon;
    if (s == "afternoon") return Session::Afternoon;
    throw std::invalid_argument("Unknown session: " + s);
}

int LabSchedule::totalStudents() const {
    int total = 0;
    for (const TimeSlot& slot : slots) {
        total += static_cast<int>(slot.registerNumbers.size());
    }
    return total;
}

std::vector<std::string> ScheduleRequest::allRegisterNumbers() const {
    if (!examDates.empty()) {
        std::vector<std::string> all;
        for (const ExamDate& ed : examDates) {
            all.insert(all.end(), ed.registerNumbers.begin(), ed.registerNumbers.end());
        }
        if (!all.empty()) return all;
    }

    if (!semesters.empty()) {
        std::vector<std::string> all;
        for (const Semester& s : semesters) {
            std::vector<std::string> part = s.allRegisterNumbers();
            all.insert(all.end(), part.begin(), part.end());
        }
        return all;
    }

    return registerNumbers;
}

std::vector<std::string> ScheduleRequest::allDates() const {
    if (!examDates.empty()) {
        std::vector<std::string> result;
        for (const ExamDate& ed : examDates) result.push_back(ed.date);
        return result;
    }
    return dates;
}

std::optional<std::string> ScheduleRequest::subjectForDate(const std::string& date) const {
    for (const ExamDate& ed : examDates) {
        if (ed.date == date) return ed.subject;
    }
    return std::nullopt;
}
