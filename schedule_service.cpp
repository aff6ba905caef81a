#include "schedule_service.h"

#include "file_parser.h"
#include "generator.h"
#include "logger.h"
#include "parsers.h"
#include "validator.h"

#include <chrono>
#include <future>
#include <map>
#include <sstream>

// --- общая подготовка запроса ---

struct PreparedRequest {
    ScheduleRequest request;                  // registerNumbers без повторов, dates отсортированы
    std::vector<std::string> duplicates;
};

static PreparedRequest prepareRequest(ScheduleRequest request) {
    PreparedRequest prepared;

    DedupResult dedup = removeDuplicates(request.allRegisterNumbers());
    prepared.duplicates = dedup.duplicates;

    request.registerNumbers = dedup.unique;
    request.dates = sortDates(request.allDates());

    prepared.request = std::move(request);
    return prepared;
}

ApiResponse generateSchedule(ScheduleRequest rawRequest, const CapacityProfile& capacity) {
    ApiResponse resp;

    PreparedRequest prepared = prepareRequest(std::move(rawRequest));
    ScheduleRequest& request = prepared.request;

    if (!prepared.duplicates.empty()) {
        resp.warnings.push_back(buildDuplicateWarning("Duplicate register numbers removed", prepared.duplicates));
        logWarning("Удалено дубликатов: " + std::to_string(prepared.duplicates.size()));
    }

    // дата -> предмет, дата -> свои студенты
    AllocationOptions options;
    for (const ExamDate& ed : request.examDates) {
        std::string date = trim(ed.date);
        if (ed.subject.has_value() && !ed.subject->empty()) {
            options.dateSubjects[date] = *ed.subject;
        }
        if (!ed.registerNumbers.empty()) {
            options.dateRegisterNumbers[date] = ed.registerNumbers;
        }
    }

    ScheduleValidator validator(capacity);
    ValidationResult vr = validator.checkAll(request);
    resp.warnings.insert(resp.warnings.end(), vr.warnings.begin(), vr.warnings.end());

    if (!vr.ok) {
        resp.success = false;
        resp.errors = vr.errors;
        return resp;
    }

    options.internalExaminers = request.internalExaminers;
    options.externalExaminers = request.externalExaminers;
    options.semesters         = request.semesters;
    options.capacity          = capacity;

    std::vector<LabSchedule> schedules = allocateStudents(
        request.registerNumbers,
        request.dates,
        vr.labsToUse,
        options
    );

    resp.success = true;
    resp.data = formatScheduleResponse(
        request.examMetadata,
        request.internalExaminers,
        request.externalExaminers,
        schedules
    );
    return resp;
}

ValidateResponse validateSchedule(ScheduleRequest rawRequest, const CapacityProfile& capacity) {
    ValidateResponse resp;

    PreparedRequest prepared = prepareRequest(std::move(rawRequest));
    const ScheduleRequest& request = prepared.request;

    if (!prepared.duplicates.empty()) {
        resp.warnings.push_back(buildDuplicateWarning("Duplicate register numbers found", prepared.duplicates));
    }

    ScheduleValidator validator(capacity);
    ValidationResult vr = validator.checkAll(request);
    resp.warnings.insert(resp.warnings.end(), vr.warnings.begin(), vr.warnings.end());

    resp.success = vr.ok;
    resp.errors  = vr.errors;

    resp.summary.totalStudents     = (int)request.registerNumbers.size();
    resp.summary.duplicatesFound   = (int)prepared.duplicates.size();
    resp.summary.datesProvided     = (int)request.dates.size();
    resp.summary.labsProvided      = (int)request.labs.size();
    resp.summary.internalExaminers = (int)request.internalExaminers.size();
    resp.summary.externalExaminers = (int)request.externalExaminers.size();
    resp.summary.semesters         = (int)request.semesters.size();
    return resp;
}

AutoSelectResponse autoSelectDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays,
    const std::vector<std::string>& subjects,
    const CapacityProfile& capacity
) {
    AutoScheduledDates picked = autoScheduleDates(availableDates, studentCount, minGapDays, subjects, capacity);

    AutoSelectResponse resp;
    resp.success         = true;
    resp.examDates       = picked.examDates;
    resp.message         = picked.message;
    resp.requiredDays    = calculateRequiredDays(studentCount, capacity);
    resp.availableDays   = (int)availableDates.size();
    resp.studentsPerDay  = capacity.dailyCapacity();
    resp.minGapRequested = minGapDays;
    resp.totalStudents   = studentCount;
    for (const ExamDate& ed : picked.examDates) resp.selectedDates.push_back(ed.date);

    logInfo("Автоподбор дат: " + resp.message);
    return resp;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// одна непустая строка = один номер, пробелы внутри строки сохраняются
static std::vector<std::string> nonEmptyLines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        std::string cleaned = trim(line);
        if (!cleaned.empty()) lines.push_back(cleaned);
    }
    return lines;
}

UploadResponse parseUploadedFile(const std::string& filename, const std::string& content) {
    UploadResponse resp;

    std::vector<Semester> semesters;
    if (endsWith(toLower(filename), ".csv") || content.find(',') != std::string::npos) {
        semesters = parseCsvContent(content);
    } else {
        semesters = extractRegisterNumbersFromText(content).semesters;
    }

    if (semesters.empty()) {
        // просто список строк
        std::vector<std::string> lines = nonEmptyLines(content);
        if (!lines.empty()) {
            semesters.push_back(Semester{"S1", {Batch{"A", lines}}});
        }
    }

    resp.success       = true;
    resp.semesters     = semesters;
    resp.totalStudents = countStudents(semesters);
    resp.message = "Extracted " + std::to_string(resp.totalStudents) +
                   " register numbers from " + std::to_string(semesters.size()) + " semester(s)";

    logInfo("Загрузка файла '" + filename + "': " + resp.message);
    return resp;
}

bool isSupportedImageType(const std::string& mimeType) {
    return mimeType == "image/png" || mimeType == "image/jpeg" || mimeType == "image/jpg";
}

UploadResponse analyzeUploadedImage(
    const std::string& content,
    const std::string& mimeType,
    const vision::BackendList& backends,
    const VisionConfig& config,
    std::shared_ptr<std::atomic<bool>> cancel
) {
    UploadResponse resp;
    resp.success = false;

    if (!config.enabled()) {
        resp.error = "Image analysis API key not configured on server. Please contact administrator.";
        return resp;
    }

    std::string mime = mimeType.empty() ? "image/png" : mimeType;
    if (!isSupportedImageType(mime)) {
        resp.error = "Invalid image format. Supported formats: PNG, JPG, JPEG. Got: " + mime;
        return resp;
    }

    // одно обращение на изображение; таймаут у каждой попытки свой
    std::future<vision::VisionOutcome> pending = vision::analyzeImageAsync(
        backends,
        vision::VisionRequest{content, mime},
        std::chrono::seconds(config.timeoutSeconds),
        cancel
    );
    vision::VisionOutcome outcome = pending.get();

    if (outcome.status != vision::VisionOutcome::Status::Ok || outcome.text.empty()) {
        resp.error = "Failed to analyze image. Please try again or use a different image.";
        return resp;
    }

    VisionParseResult parsed = parseVisionResponse(outcome.text);

    resp.success       = true;
    resp.semesters     = parsed.semesters;
    resp.totalStudents = (int)parsed.registerNumbers.size();
    resp.extractedData = parsed.extracted;
    resp.rawResponse   = outcome.text;
    resp.message = "Extracted " + std::to_string(resp.totalStudents) +
                   " register numbers and additional exam data using AI";
    return resp;
}
