#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "api_dto.h"
#include "date_selector.h"
#include "model.h"
#include "validator.h"

// --- модели ---
void to_json(nlohmann::json& j, const Examiner& e);
void from_json(const nlohmann::json& j, Examiner& e);

void to_json(nlohmann::json& j, const Batch& b);
void from_json(const nlohmann::json& j, Batch& b);

void to_json(nlohmann::json& j, const Semester& s);
void from_json(const nlohmann::json& j, Semester& s);

void to_json(nlohmann::json& j, const ExamMetadata& m);
void from_json(const nlohmann::json& j, ExamMetadata& m);

void to_json(nlohmann::json& j, const ExamDate& d);
void from_json(const nlohmann::json& j, ExamDate& d);

void to_json(nlohmann::json& j, const TimeSlot& t);
void from_json(const nlohmann::json& j, TimeSlot& t);

void to_json(nlohmann::json& j, const LabSchedule& s);
void from_json(const nlohmann::json& j, LabSchedule& s);

void to_json(nlohmann::json& j, const ScheduleRequest& r);
void from_json(const nlohmann::json& j, ScheduleRequest& r);

void to_json(nlohmann::json& j, const ScheduleResponse& r);
void from_json(const nlohmann::json& j, ScheduleResponse& r);

// --- DTO ответов ---
void to_json(nlohmann::json& j, const ValidationError& e);
void to_json(nlohmann::json& j, const ApiResponse& r);
void to_json(nlohmann::json& j, const ValidateResponse& r);
void to_json(nlohmann::json& j, const AutoSelectResponse& r);
void to_json(nlohmann::json& j, const ExtractedData& d);
void to_json(nlohmann::json& j, const UploadResponse& r);
void to_json(nlohmann::json& j, const CapacityRequirements& r);

// форматированный JSON (отступ 2) и обратный разбор
std::string scheduleToJson(const ScheduleResponse& response);
ScheduleResponse scheduleFromJson(const std::string& text);

std::string buildApiResponseJsonString(const ApiResponse& resp);
