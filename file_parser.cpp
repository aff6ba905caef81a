#include "file_parser.h"

#include "logger.h"
#include "parsers.h"

#include <map>
#include <regex>
#include <sstream>
#include <unordered_set>
#include <algorithm>

const char* const kRegisterNumberPattern = "[A-Z]{2,4}[0-9]{2}[A-Z]{2,3}[0-9]{3}";

static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

static std::vector<std::string> splitBy(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : line) {
        if (c == delim) {
            parts.push_back(trim(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(trim(cur));
    return parts;
}

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

static std::string normalizeSemester(std::string sem) {
    sem = toUpper(sem);
    if (!startsWith(sem, "S")) sem = "S" + sem;
    return sem;
}

// ==================== CSV ====================

std::vector<Semester> parseCsvContent(const std::string& content) {
    std::vector<std::string> lines = splitLines(trim(content));
    if (lines.empty()) return {};

    std::string firstLine = trim(lines[0]);
    std::string firstLower = toLower(firstLine);

    bool hasHeader = false;
    for (const char* h : {"semester", "batch", "register", "roll"}) {
        if (firstLower.find(h) != std::string::npos) hasHeader = true;
    }

    char delimiter = 0;
    if (firstLine.find(',') != std::string::npos) delimiter = ',';
    else if (firstLine.find('\t') != std::string::npos) delimiter = '\t';

    // semester -> batch -> номера
    std::map<std::string, std::map<std::string, std::vector<std::string>>> result;

    for (size_t i = hasHeader ? 1 : 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) continue;

        std::string sem = "S1";
        std::string batch = "A";
        std::string regNo;

        if (delimiter) {
            std::vector<std::string> parts = splitBy(line, delimiter);
            if (parts.size() >= 3) {
                sem   = toUpper(parts[0]);
                batch = toUpper(parts[1]);
                regNo = parts[2];
            } else if (parts.size() == 2) {
                sem   = toUpper(parts[0]);
                regNo = parts[1];
            } else {
                regNo = parts[0];
            }
        } else {
            regNo = line;
        }

        sem = normalizeSemester(sem);

        std::vector<std::string>& list = result[sem][batch];
        if (!regNo.empty() && std::find(list.begin(), list.end(), regNo) == list.end()) {
            list.push_back(regNo);
        }
    }

    std::vector<Semester> semesters;
    for (const auto& semEntry : result) {
        Semester s;
        s.name = semEntry.first;
        for (const auto& batchEntry : semEntry.second) {
            s.batches.push_back(Batch{batchEntry.first, batchEntry.second});
        }
        semesters.push_back(s);
    }

    logDebug("CSV: семестров=" + std::to_string(semesters.size()) +
             ", студентов=" + std::to_string(countStudents(semesters)));
    return semesters;
}

// ==================== свободный текст ====================

static std::vector<std::string> findAllRegisterNumbers(const std::string& upperText) {
    static const std::regex re(std::string("\\b") + kRegisterNumberPattern + "\\b");

    std::vector<std::string> found;
    for (auto it = std::sregex_iterator(upperText.begin(), upperText.end(), re);
         it != std::sregex_iterator(); ++it) {
        found.push_back(it->str());
    }
    return found;
}

TextExtraction extractRegisterNumbersFromText(const std::string& text) {
    static const std::regex semRe("(?:semester|sem)[:\\s]*(s?\\d+)", std::regex::icase);
    static const std::regex batchRe("(?:batch|division|div)[:\\s]*([a-z])", std::regex::icase);

    TextExtraction result;
    result.registerNumbers = findAllRegisterNumbers(toUpper(text));
    if (result.registerNumbers.empty()) return result;

    std::smatch m;
    std::string semester = "S1";
    if (std::regex_search(text, m, semRe)) {
        semester = normalizeSemester(m[1].str());
    }

    std::string batch = "A";
    if (std::regex_search(text, m, batchRe)) {
        batch = toUpper(m[1].str());
    }

    Batch b;
    b.name = batch;
    b.registerNumbers = removeDuplicates(result.registerNumbers).unique;
    result.semesters.push_back(Semester{semester, {b}});
    return result;
}

// ==================== ответ модели ====================

namespace {

enum class Section {
    None,
    Dates,
    Labs,
    InternalExaminers,
    ExternalExaminers,
    Subjects,
    RegisterNumbers,
    RawText
};

struct SectionHeader {
    const char* prefix;
    Section section;
};

const SectionHeader kSections[] = {
    {"DATES:", Section::Dates},
    {"LABS:", Section::Labs},
    {"INTERNAL_EXAMINERS:", Section::InternalExaminers},
    {"EXTERNAL_EXAMINERS:", Section::ExternalExaminers},
    {"SUBJECTS:", Section::Subjects},
    {"REGISTER_NUMBERS:", Section::RegisterNumbers},
    {"RAW_TEXT:", Section::RawText},
};

std::string afterColon(const std::string& line) {
    size_t pos = line.find(':');
    return pos == std::string::npos ? std::string() : trim(line.substr(pos + 1));
}

// убираем маркеры списка: "1. ", "- ", "* "
std::string stripListMarker(const std::string& line) {
    static const std::regex markerRe("^[0-9.\\-*\\s]+");
    return trim(std::regex_replace(line, markerRe, "", std::regex_constants::format_first_only));
}

// "ID: Name", "ID:Name" или просто имя (тогда id = INT1, EXT2, ...)
Examiner parseExaminerLine(const std::string& cleaned, const std::string& idPrefix, size_t index) {
    if (cleaned.find(": ") != std::string::npos) {
        Examiner e = Examiner::fromString(cleaned);
        return Examiner{trim(e.id), trim(e.name)};
    }
    size_t colon = cleaned.find(':');
    if (colon != std::string::npos) {
        return Examiner{trim(cleaned.substr(0, colon)), trim(cleaned.substr(colon + 1))};
    }
    return Examiner{idPrefix + std::to_string(index + 1), cleaned};
}

}  // namespace

static void applySectionLine(Section section, const std::string& line,
                             ExtractedData& data, std::unordered_set<std::string>& seen) {
    static const std::regex dateRe("\\d{1,2}[-/]\\d{1,2}[-/]\\d{2,4}");
    static const std::regex regRe(kRegisterNumberPattern);

    // дату ищем в исходной строке: маркер списка съел бы и саму дату "05-09-25"
    if (section == Section::Dates) {
        std::smatch m;
        if (std::regex_search(line, m, dateRe)) {
            std::string d = m.str();
            std::replace(d.begin(), d.end(), '/', '-');
            data.dates.push_back(d);
            return;
        }
    }

    std::string cleaned = stripListMarker(line);
    if (cleaned.empty()) return;

    switch (section) {
        case Section::Dates:
            data.dates.push_back(cleaned);
            break;
        case Section::Labs:
            data.labs.push_back(cleaned);
            break;
        case Section::InternalExaminers:
            data.internalExaminers.push_back(
                parseExaminerLine(cleaned, "INT", data.internalExaminers.size()));
            break;
        case Section::ExternalExaminers:
            data.externalExaminers.push_back(
                parseExaminerLine(cleaned, "EXT", data.externalExaminers.size()));
            break;
        case Section::Subjects:
            data.subjects.push_back(cleaned);
            break;
        case Section::RegisterNumbers: {
            std::smatch m;
            std::string upper = toUpper(cleaned);
            if (std::regex_search(upper, m, regRe)) {
                std::string num = m.str();
                if (seen.insert(num).second) data.registerNumbers.push_back(num);
            }
            break;
        }
        case Section::RawText:
            data.rawText += cleaned + "\n";
            break;
        case Section::None:
            break;
    }
}

VisionParseResult parseVisionResponse(const std::string& response) {
    VisionParseResult result;
    ExtractedData& data = result.extracted;

    Section current = Section::None;
    std::unordered_set<std::string> seen;

    for (const std::string& rawLine : splitLines(trim(response))) {
        std::string line = trim(rawLine);
        if (line.empty()) continue;

        std::string upper = toUpper(line);

        if (startsWith(upper, "EXAM_NAME:")) {
            data.examName = afterColon(line);
            current = Section::None;
            continue;
        }
        if (startsWith(upper, "DEPARTMENT:")) {
            data.department = afterColon(line);
            current = Section::None;
            continue;
        }
        if (startsWith(upper, "SEMESTER:")) {
            std::string v = afterColon(line);
            if (!v.empty()) data.semester = normalizeSemester(v);
            current = Section::None;
            continue;
        }
        if (startsWith(upper, "BATCH:")) {
            std::string v = afterColon(line);
            if (!v.empty()) data.batch = toUpper(v.substr(0, 1));
            current = Section::None;
            continue;
        }
        if (startsWith(upper, "ACADEMIC_YEAR:")) {
            data.academicYear = afterColon(line);
            current = Section::None;
            continue;
        }

        bool isHeader = false;
        for (const SectionHeader& h : kSections) {
            if (startsWith(upper, h.prefix)) {
                current = h.section;
                isHeader = true;
                // значение может стоять на той же строке: "DATES: 05-09-25"
                std::string inlineValue = afterColon(line);
                if (!inlineValue.empty()) applySectionLine(current, inlineValue, data, seen);
                break;
            }
        }
        if (isHeader || current == Section::None) continue;

        applySectionLine(current, line, data, seen);
    }

    // сквозной поиск: номера вне секции REGISTER_NUMBERS
    for (const std::string& num : findAllRegisterNumbers(toUpper(response))) {
        if (seen.insert(num).second) data.registerNumbers.push_back(num);
    }

    result.registerNumbers = data.registerNumbers;
    if (!data.registerNumbers.empty()) {
        result.semesters.push_back(Semester{data.semester, {Batch{data.batch, data.registerNumbers}}});
    }

    logInfo("Разбор ответа модели: номеров=" + std::to_string(data.registerNumbers.size()) +
            ", дат=" + std::to_string(data.dates.size()) +
            ", лабораторий=" + std::to_string(data.labs.size()));
    return result;
}
