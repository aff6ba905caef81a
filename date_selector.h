#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model.h"

struct DateSelection {
    std::vector<std::string> dates;   // отсортированы по времени
    std::string message;              // пояснение для пользователя
};

// ceil(studentCount / dailyCapacity), 0 для studentCount <= 0
int calculateRequiredDays(int studentCount, const CapacityProfile& profile = CapacityProfile{});

// max(0, required - providedDates)
int calculateAdditionalDatesNeeded(int studentCount, int providedDates,
                                   const CapacityProfile& profile = CapacityProfile{});

// Минимальное число дней из пула с соблюдением интервала minGapDays.
// Не бросает: при нехватке дат или интервала возвращает пояснение.
DateSelection selectOptimalDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays = 1,
    const CapacityProfile& profile = CapacityProfile{}
);

struct AutoScheduledDates {
    std::vector<ExamDate> examDates;  // i-я дата получает i-й предмет
    std::string message;
};

AutoScheduledDates autoScheduleDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays,
    const std::vector<std::string>& subjects,
    const CapacityProfile& profile = CapacityProfile{}
);

struct CapacityRequirements {
    int studentCount;
    int dailyCapacity;
    int requiredDays;
    int availableDates;
    std::optional<bool> datesSufficient;        // только если availableDates > 0
    std::optional<int>  additionalDatesNeeded;
};

CapacityRequirements calculateRequirements(int studentCount, int availableDates,
                                           const CapacityProfile& profile = CapacityProfile{});
