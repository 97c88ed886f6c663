#ifndef MPLAUNCH_PROCESS_HPP
#define MPLAUNCH_PROCESS_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mplaunch {

class Process {
public:
  // Starts argv[0] (PATH lookup) detached from the launcher, with env added
  // on top of the launcher's environment. Returns the pid of the new process.
  // Throws Error(LAUNCH) if fork or exec fails.
  static int spawnDetached(const std::vector<std::string> &argv,
                           const std::map<std::string, std::string> &env);

  // Runs a shell command and returns its stdout, or nullopt if it could not
  // be started or exited non-zero.
  static std::optional<std::string> captureOutput(const std::string &command);
};

} // namespace mplaunch

#endif // MPLAUNCH_PROCESS_HPP
