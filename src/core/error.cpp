#include "mplaunch/error.hpp"

namespace mplaunch {

std::string errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PARSE:
    return "parse";
  case ErrorKind::RESOLUTION:
    return "resolution";
  case ErrorKind::TRANSPORT:
    return "transport";
  case ErrorKind::STATUS:
    return "status";
  case ErrorKind::IO:
    return "io";
  case ErrorKind::ARCHIVE:
    return "archive";
  case ErrorKind::CONTRACT:
    return "contract";
  case ErrorKind::LAUNCH:
    return "launch";
  }
  return "unknown";
}

} // namespace mplaunch
