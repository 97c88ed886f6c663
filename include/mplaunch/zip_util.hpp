#ifndef MPLAUNCH_ZIP_UTIL_HPP
#define MPLAUNCH_ZIP_UTIL_HPP

#include <filesystem>
#include <string>

namespace mplaunch {

class ZipUtil {
public:
  // Extracts the single entry whose path equals memberName into destFile,
  // replacing it. Throws Error(ARCHIVE) if the archive cannot be opened or
  // read or has no such member, Error(IO) if destFile cannot be written.
  static void extractMember(const std::filesystem::path &archivePath,
                            const std::string &memberName,
                            const std::filesystem::path &destFile);
};

} // namespace mplaunch

#endif // MPLAUNCH_ZIP_UTIL_HPP
