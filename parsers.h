#pragma once

#include <optional>
#include <string>
#include <vector>

struct DedupResult {
    std::vector<std::string> unique;       // первые вхождения, порядок сохранён
    std::vector<std::string> duplicates;   // повторы в порядке появления
};

DedupResult removeDuplicates(const std::vector<std::string>& registerNumbers);

// "DD-MM-YY" -> номер дня от 1970-01-01; nullopt, если формат или дата неверны.
std::optional<long> parseExamDate(const std::string& token);

// |b - a| в днях, бросает std::invalid_argument на неверной дате
int daysBetween(const std::string& a, const std::string& b);

// Хронологическая сортировка; нераспознанные даты уходят в конец
// в исходном порядке, чтобы их показал валидатор.
std::vector<std::string> sortDates(const std::vector<std::string>& dates);

std::string formatDates(const std::vector<std::string>& dates);

// --- регистрационные номера из textarea / CSV ---
std::vector<std::string> parseRegisterNumbers(const std::string& text);
std::string formatRegisterNumbers(const std::vector<std::string>& registerNumbers);
std::vector<std::string> parseCsvRegisterNumbers(const std::string& csvContent);

std::string trim(const std::string& s);
std::string toUpper(std::string s);
std::string toLower(std::string s);
