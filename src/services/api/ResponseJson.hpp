#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors/ServiceError.hpp"

namespace wam {

struct PipelineResult;

// {success: true, image_url, storage_path?, generation_duration_ms?,
//  cost_units?, background_removal_status, message, processing_time_ms}
nlohmann::json result_to_json(const PipelineResult& r);

// {success: false, error, error_code}
nlohmann::json error_to_json(ErrorCode code, const std::string& message);

} // namespace wam
