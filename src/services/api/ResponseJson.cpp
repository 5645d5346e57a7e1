#include "ResponseJson.hpp"

#include "services/pipeline/Orchestrator.hpp"

using nlohmann::json;

namespace wam {

json result_to_json(const PipelineResult& r) {
  json out = {
    {"success", r.success},
    {"image_url", r.imageUrl},
    {"background_removal_status", r.backgroundRemovalStatus},
    {"message", r.message},
    {"processing_time_ms", r.processingTimeMs},
  };
  if (!r.storagePath.empty()) out["storage_path"] = r.storagePath;
  if (r.generationDurationMs) out["generation_duration_ms"] = *r.generationDurationMs;
  if (r.costUnits) out["cost_units"] = *r.costUnits;
  return out;
}

json error_to_json(ErrorCode code, const std::string& message) {
  return {
    {"success", false},
    {"error", message},
    {"error_code", to_string(code)},
  };
}

} // namespace wam
