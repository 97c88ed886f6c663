#ifndef MPLAUNCH_ERROR_HPP
#define MPLAUNCH_ERROR_HPP

#include <stdexcept>
#include <string>

namespace mplaunch {

enum class ErrorKind {
  PARSE,      // malformed version string
  RESOLUTION, // no matching asset, unknown platform, bad metadata
  TRANSPORT,  // network failure
  STATUS,     // non-success HTTP response
  IO,         // file create/write/permission failure
  ARCHIVE,    // zip open/member lookup/extract failure
  CONTRACT,   // progress sender not wired up
  LAUNCH      // installed build could not be started
};

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

std::string errorKindName(ErrorKind kind);

} // namespace mplaunch

#endif // MPLAUNCH_ERROR_HPP
