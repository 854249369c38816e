#include "rowan/data/data_error.hpp"

#include <string>
#include <utility>

namespace rowan::data {

auto ToString(DataErrorKind kind) -> const char* {
  switch (kind) {
    case DataErrorKind::kMemberNotFound:
      return "member not found";
    case DataErrorKind::kInvalidRowShape:
      return "invalid row shape";
    case DataErrorKind::kUnsupportedDataShape:
      return "unsupported data shape";
  }
  return "unknown";
}

DataResolutionError::DataResolutionError(
    DataErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {
}

}  // namespace rowan::data
