#include "aed/util/util.hpp"

namespace aed::util {
std::string_view error_name(ErrorCode e) noexcept {
  switch (e) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::SizeMismatch:
      return "SizeMismatch";
    case ErrorCode::OutOfMemory:
      return "OutOfMemory";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::DecodeError:
      return "DecodeError";
    case ErrorCode::FormatError:
      return "FormatError";
    case ErrorCode::UnsupportedFormat:
      return "UnsupportedFormat";
    case ErrorCode::DspError:
      return "DspError";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::Unavailable:
      return "Unavailable";
    case ErrorCode::Timeout:
      return "Timeout";
    case ErrorCode::CacheCorrupt:
      return "CacheCorrupt";
    case ErrorCode::ModelUnavailable:
      return "ModelUnavailable";
    case ErrorCode::InferenceError:
      return "InferenceError";
    case ErrorCode::PersistenceError:
      return "PersistenceError";
    case ErrorCode::ResourceExhausted:
      return "ResourceExhausted";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Unknown";
}

std::string_view error_description(ErrorCode e) noexcept {
  switch (e) {
    case ErrorCode::None:
      return "Success";
    case ErrorCode::InvalidArgument:
      return "An input argument violated preconditions.";
    case ErrorCode::SizeMismatch:
      return "Buffer or shape sizes do not match.";
    case ErrorCode::OutOfMemory:
      return "Allocation failed due to insufficient memory.";
    case ErrorCode::IOError:
      return "Underlying I/O operation failed.";
    case ErrorCode::DecodeError:
      return "Audio container is unsupported or corrupt.";
    case ErrorCode::FormatError:
      return "Audio decoded to a zero-length signal.";
    case ErrorCode::UnsupportedFormat:
      return "Requested format or feature is not supported.";
    case ErrorCode::DspError:
      return "DSP backend reported a failure.";
    case ErrorCode::NotFound:
      return "Requested item does not exist.";
    case ErrorCode::Unavailable:
      return "Subsystem not initialized or temporarily unavailable.";
    case ErrorCode::Timeout:
      return "Operation exceeded allowed time.";
    case ErrorCode::CacheCorrupt:
      return "Model cache is incomplete or unreadable.";
    case ErrorCode::ModelUnavailable:
      return "Classifier model could not be acquired.";
    case ErrorCode::InferenceError:
      return "Classifier failed to run on the waveform.";
    case ErrorCode::PersistenceError:
      return "Result could not be recorded by a sink.";
    case ErrorCode::ResourceExhausted:
      return "Resource exhausted or unavailable.";
    case ErrorCode::Internal:
      return "An internal invariant was violated (bug).";
  }
  return "Unknown error";
}
} // namespace aed::util
