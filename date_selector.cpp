#include "date_selector.h"

#include "logger.h"
#include "parsers.h"

#include <algorithm>
#include <cstdio>

int calculateRequiredDays(int studentCount, const CapacityProfile& profile) {
    if (studentCount <= 0) return 0;
    int daily = profile.dailyCapacity();
    // без studentCount + daily - 1: переполнение на больших значениях
    return studentCount / daily + (studentCount % daily != 0 ? 1 : 0);
}

int calculateAdditionalDatesNeeded(int studentCount, int providedDates, const CapacityProfile& profile) {
    return std::max(0, calculateRequiredDays(studentCount, profile) - providedDates);
}

static std::string formatAvgGap(double avg) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", avg);
    return std::string(buf);
}

DateSelection selectOptimalDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays,
    const CapacityProfile& profile
) {
    DateSelection result;

    if (availableDates.empty()) {
        result.message = "No dates provided";
        return result;
    }

    int requiredDays = calculateRequiredDays(studentCount, profile);
    if (requiredDays == 0) {
        result.message = "No students to schedule";
        return result;
    }

    std::vector<std::string> sorted = sortDates(availableDates);
    const std::string students = std::to_string(studentCount);

    logDebug("Подбор дат: студентов=" + students +
             ", нужно дней=" + std::to_string(requiredDays) +
             ", доступно=" + std::to_string(sorted.size()) +
             ", minGap=" + std::to_string(minGapDays));

    if ((int)sorted.size() < requiredDays) {
        result.dates = sorted;
        result.message = "Warning: Only " + std::to_string(sorted.size()) +
                         " dates available, need " + std::to_string(requiredDays) +
                         " for " + students + " students";
        logWarning(result.message);
        return result;
    }

    if (requiredDays == 1) {
        result.dates.push_back(sorted.front());
        result.message = "Selected 1 date for " + students + " students";
        return result;
    }

    std::vector<std::string> selected;

    if (minGapDays <= 1) {
        selected.assign(sorted.begin(), sorted.begin() + requiredDays);
    } else {
        // жадно: берём дату, если от последней выбранной прошло >= minGapDays
        selected.push_back(sorted.front());
        for (size_t i = 1; i < sorted.size() && (int)selected.size() < requiredDays; ++i) {
            std::optional<long> last = parseExamDate(selected.back());
            std::optional<long> cur  = parseExamDate(sorted[i]);
            if (!last || !cur) continue;

            long gap = *cur - *last;
            if (gap < 0) gap = -gap;
            if (gap >= minGapDays) {
                selected.push_back(sorted[i]);
            }
        }

        if ((int)selected.size() < requiredDays) {
            result.dates.assign(sorted.begin(), sorted.begin() + requiredDays);
            result.message = "Selected " + std::to_string(requiredDays) +
                             " dates (gap constraint relaxed due to limited dates)";
            logWarning("Интервал " + std::to_string(minGapDays) +
                       " дн. не выдерживается, берём первые " + std::to_string(requiredDays) + " дат");
            return result;
        }
    }

    // средний интервал для сообщения
    long gapSum = 0;
    int gapCount = 0;
    for (size_t i = 1; i < selected.size(); ++i) {
        std::optional<long> a = parseExamDate(selected[i - 1]);
        std::optional<long> b = parseExamDate(selected[i]);
        if (!a || !b) continue;
        long gap = *b - *a;
        gapSum += gap < 0 ? -gap : gap;
        ++gapCount;
    }

    result.dates = selected;
    result.message = "Selected " + std::to_string(selected.size()) +
                     " dates for " + students + " students";
    if (gapCount > 0) {
        result.message += " (avg gap: " + formatAvgGap((double)gapSum / (double)gapCount) + " days)";
    }
    return result;
}

AutoScheduledDates autoScheduleDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays,
    const std::vector<std::string>& subjects,
    const CapacityProfile& profile
) {
    DateSelection sel = selectOptimalDates(availableDates, studentCount, minGapDays, profile);

    AutoScheduledDates result;
    result.message = sel.message;
    for (size_t i = 0; i < sel.dates.size(); ++i) {
        ExamDate ed;
        ed.date = sel.dates[i];
        if (i < subjects.size()) ed.subject = subjects[i];
        result.examDates.push_back(ed);
    }
    return result;
}

CapacityRequirements calculateRequirements(int studentCount, int availableDates, const CapacityProfile& profile) {
    CapacityRequirements r;
    r.studentCount   = studentCount;
    r.dailyCapacity  = profile.dailyCapacity();
    r.requiredDays   = calculateRequiredDays(studentCount, profile);
    r.availableDates = availableDates;
    if (availableDates > 0) {
        r.datesSufficient       = availableDates >= r.requiredDays;
        r.additionalDatesNeeded = std::max(0, r.requiredDays - availableDates);
    }
    return r;
}
