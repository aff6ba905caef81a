#pragma once

#include <string>
#include <vector>

#include "api_dto.h"
#include "model.h"

// Регистрационный номер: 2-4 буквы, 2 цифры, 2-3 буквы, 3 цифры (TVE20CS001).
extern const char* const kRegisterNumberPattern;

// CSV/TSV: "semester,batch,reg" | "semester,reg" | "reg". Семестры и группы
// отсортированы по имени, повторы внутри группы отброшены.
std::vector<Semester> parseCsvContent(const std::string& content);

struct TextExtraction {
    std::vector<Semester> semesters;          // пусто, если номеров не нашли
    std::vector<std::string> registerNumbers; // все совпадения, с повторами
};

// Поиск номеров по шаблону в произвольном тексте + "sem"/"batch" подсказки.
TextExtraction extractRegisterNumbersFromText(const std::string& text);

struct VisionParseResult {
    std::vector<Semester> semesters;
    std::vector<std::string> registerNumbers;
    ExtractedData extracted;
};

// Разбор текстового ответа модели по заголовкам секций (DATES:, LABS:, ...)
// плюс сквозной поиск номеров по всему тексту.
VisionParseResult parseVisionResponse(const std::string& response);
