/**
 * @file status.cpp
 * @brief Names and formatting for pipeline status values.
 */
#include "status.hpp"

#include <sstream>

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorKind::CorruptChunk:
    return "CorruptChunk";
  case ErrorKind::MalformedContainer:
    return "MalformedContainer";
  case ErrorKind::PartialDecompression:
    return "PartialDecompression";
  case ErrorKind::CompressionFailure:
    return "CompressionFailure";
  case ErrorKind::IoError:
    return "IoError";
  case ErrorKind::WorkerFailure:
    return "WorkerFailure";
  }
  return "Unknown";
}

const char *stage_name(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::Idle:
    return "Idle";
  case PipelineStage::Chunking:
    return "Chunking";
  case PipelineStage::ContainerRead:
    return "ContainerRead";
  case PipelineStage::Dispatching:
    return "Dispatching";
  case PipelineStage::Reordering:
    return "Reordering";
  case PipelineStage::ContainerWrite:
    return "ContainerWrite";
  case PipelineStage::Concatenating:
    return "Concatenating";
  case PipelineStage::Done:
    return "Done";
  }
  return "Unknown";
}

std::string describe(const PipelineStatus &status) {
  if (status.ok())
    return "OK";

  constexpr size_t MAX_LISTED_INDICES = 8;
  std::ostringstream os;
  os << error_kind_name(status.error) << " at " << stage_name(status.stage);
  if (!status.message.empty())
    os << ": " << status.message;
  if (!status.failed_indices.empty()) {
    os << " (chunks";
    for (size_t i = 0;
         i < status.failed_indices.size() && i < MAX_LISTED_INDICES; ++i)
      os << ' ' << status.failed_indices[i];
    if (status.failed_indices.size() > MAX_LISTED_INDICES)
      os << " ... " << status.failed_indices.size() << " total";
    os << ")";
  }
  return os.str();
}
