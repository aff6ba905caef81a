#include "parsers.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string toUpper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ==================== дубликаты ====================

DedupResult removeDuplicates(const std::vector<std::string>& registerNumbers) {
    DedupResult result;
    std::unordered_set<std::string> seen;

    for (const std::string& regNo : registerNumbers) {
        if (seen.count(regNo)) {
            result.duplicates.push_back(regNo);
        } else {
            seen.insert(regNo);
            result.unique.push_back(regNo);
        }
    }
    return result;
}

// ==================== даты ====================

static bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return days[m - 1];
}

// дни от 1970-01-01 (алгоритм days_from_civil)
static long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static bool readNumber(const std::string& s, size_t& pos, size_t minDigits, size_t maxDigits, int& out) {
    size_t start = pos;
    int value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) && pos - start < maxDigits) {
        value = value * 10 + (s[pos] - '0');
        ++pos;
    }
    if (pos - start < minDigits) return false;
    out = value;
    return true;
}

std::optional<long> parseExamDate(const std::string& token) {
    std::string s = trim(token);
    size_t pos = 0;
    int day = 0, month = 0, yy = 0;

    if (!readNumber(s, pos, 1, 2, day)) return std::nullopt;
    if (pos >= s.size() || s[pos] != '-') return std::nullopt;
    ++pos;
    if (!readNumber(s, pos, 1, 2, month)) return std::nullopt;
    if (pos >= s.size() || s[pos] != '-') return std::nullopt;
    ++pos;
    if (!readNumber(s, pos, 2, 2, yy)) return std::nullopt;
    if (pos != s.size()) return std::nullopt;

    // как у strptime %y: 69-99 -> 19xx, 00-68 -> 20xx
    int year = yy >= 69 ? 1900 + yy : 2000 + yy;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    return daysFromCivil(year, month, day);
}

int daysBetween(const std::string& a, const std::string& b) {
    std::optional<long> da = parseExamDate(a);
    std::optional<long> db = parseExamDate(b);
    if (!da || !db) {
        throw std::invalid_argument("Invalid date: " + (da ? b : a));
    }
    long diff = *db - *da;
    return static_cast<int>(diff < 0 ? -diff : diff);
}

std::vector<std::string> sortDates(const std::vector<std::string>& dates) {
    const long kMaxDay = std::numeric_limits<long>::max();

    std::vector<std::pair<long, std::string>> parsed;
    parsed.reserve(dates.size());
    for (const std::string& d : dates) {
        std::string cleaned = trim(d);
        std::optional<long> day = parseExamDate(cleaned);
        parsed.emplace_back(day ? *day : kMaxDay, cleaned);
    }

    std::stable_sort(parsed.begin(), parsed.end(),
        [](const std::pair<long, std::string>& a, const std::pair<long, std::string>& b) {
            return a.first < b.first;
        }
    );

    std::vector<std::string> result;
    result.reserve(parsed.size());
    for (auto& p : parsed) result.push_back(std::move(p.second));
    return result;
}

std::string formatDates(const std::vector<std::string>& dates) {
    std::string out;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (i) out += ", ";
        out += dates[i];
    }
    return out;
}

// ==================== регистрационные номера ====================

std::vector<std::string> parseRegisterNumbers(const std::string& text) {
    std::vector<std::string> result;

    // разделители: перевод строки, запятая или 2+ пробела подряд
    std::string current;
    auto flush = [&]() {
        std::string cleaned = trim(current);
        if (!cleaned.empty()) result.push_back(cleaned);
        current.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == ',') {
            flush();
        } else if (std::isspace(static_cast<unsigned char>(c)) && i + 1 < text.size() &&
                   std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            flush();
            while (i + 1 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 1])) &&
                   text[i + 1] != '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    flush();

    return result;
}

std::string formatRegisterNumbers(const std::vector<std::string>& registerNumbers) {
    std::string out;
    for (size_t i = 0; i < registerNumbers.size(); ++i) {
        if (i) out += "\n";
        out += registerNumbers[i];
    }
    return out;
}

std::vector<std::string> parseCsvRegisterNumbers(const std::string& csvContent) {
    std::vector<std::string> result;
    std::istringstream in(csvContent);
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // первая колонка
        std::string value = line;
        if (!value.empty() && value[0] == '"') {
            size_t close = value.find('"', 1);
            value = value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        } else {
            size_t comma = value.find(',');
            if (comma != std::string::npos) value = value.substr(0, comma);
        }
        value = trim(value);

        std::string lower = toLower(value);
        if (value.empty() ||
            lower == "register_number" || lower == "reg_no" ||
            lower == "regno" || lower == "register number") {
            continue;
        }
        result.push_back(value);
    }

    return result;
}
