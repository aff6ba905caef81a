#include "model.h"

#pragma once

struct ValidationError {
    std::string field;
    std::string message;
};

struct ValidationResult {
    bool ok;                                 // true, если нет ошибок
    std::vector<ValidationError> errors;     // блокируют распределение
    std::vector<std::string> warnings;       // только предупреждения
    std::vector<std::string> labsToUse;      // labs из запроса или значения по умолчанию
};

const std::vector<std::string>& defaultLabs();

class ScheduleValidator {
    public:
        explicit ScheduleValidator(const CapacityProfile& capacity = CapacityProfile{})
            : capacity_(capacity) {}

        // Проверяет запрос, в котором registerNumbers и dates уже подготовлены
        // (без дубликатов, даты отсортированы).
        ValidationResult checkAll(const ScheduleRequest& request) const;

        // Структура готового ответа: дата, лаборатория, ровно две смены.
        std::vector<std::string> checkScheduleStructure(const ScheduleResponse& response) const;

    private:
        void checkRegisterNumbers(
            const std::vector<std::string>& registerNumbers,
            ValidationResult& result
        ) const;

        void checkLabs(
            const std::vector<std::string>& labs,
            ValidationResult& result
        ) const;

        void checkExaminers(
            const std::vector<Examiner>& internalExaminers,
            const std::vector<Examiner>& externalExaminers,
            ValidationResult& result
        ) const;

        void checkDates(
            const std::vector<std::string>& dates,
            int studentCount,
            ValidationResult& result
        ) const;

        CapacityProfile capacity_;
    };
