#include "ItemStore.hpp"

namespace wam {

const char* to_string(ProcessingStatus s) {
  switch (s) {
    case ProcessingStatus::Pending:    return "pending";
    case ProcessingStatus::Processing: return "processing";
    case ProcessingStatus::Completed:  return "completed";
    case ProcessingStatus::Failed:     return "failed";
  }
  return "pending";
}

std::optional<ProcessingStatus> parse_processing_status(std::string_view s) {
  if (s == "pending")    return ProcessingStatus::Pending;
  if (s == "processing") return ProcessingStatus::Processing;
  if (s == "completed")  return ProcessingStatus::Completed;
  if (s == "failed")     return ProcessingStatus::Failed;
  return std::nullopt;
}

} // namespace wam
