#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "api_dto.h"
#include "config.h"
#include "date_selector.h"
#include "model.h"
#include "vision_client.h"

// Полный конвейер: дубликаты -> сортировка дат -> проверка -> распределение.
ApiResponse generateSchedule(ScheduleRequest request, const CapacityProfile& capacity);

// Та же подготовка и проверка, без распределения.
ValidateResponse validateSchedule(ScheduleRequest request, const CapacityProfile& capacity);

AutoSelectResponse autoSelectDates(
    const std::vector<std::string>& availableDates,
    int studentCount,
    int minGapDays,
    const std::vector<std::string>& subjects,
    const CapacityProfile& capacity
);

// CSV или текст; в крайнем случае каждая непустая строка = номер (S1/A).
UploadResponse parseUploadedFile(const std::string& filename, const std::string& content);

bool isSupportedImageType(const std::string& mimeType);

UploadResponse analyzeUploadedImage(
    const std::string& content,
    const std::string& mimeType,
    const vision::BackendList& backends,
    const VisionConfig& config,
    std::shared_ptr<std::atomic<bool>> cancel = nullptr
);
