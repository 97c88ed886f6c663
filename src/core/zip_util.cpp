#include "mplaunch/zip_util.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>

namespace mplaunch {

namespace {

struct ArchiveDeleter {
  void operator()(struct archive *a) const { archive_read_free(a); }
};
using ArchiveHandle = std::unique_ptr<struct archive, ArchiveDeleter>;

std::string archiveError(struct archive *a) {
  const char *msg = archive_error_string(a);
  return msg ? msg : "unknown archive error";
}

} // namespace

void ZipUtil::extractMember(const std::filesystem::path &archivePath,
                            const std::string &memberName,
                            const std::filesystem::path &destFile) {
  ArchiveHandle a(archive_read_new());
  if (!a)
    throw Error(ErrorKind::ARCHIVE, "Failed to allocate archive reader");
  archive_read_support_format_zip(a.get());
  archive_read_support_filter_all(a.get());

  if (archive_read_open_filename(a.get(), archivePath.string().c_str(),
                                 10240) != ARCHIVE_OK) {
    throw Error(ErrorKind::ARCHIVE, "Could not open archive " +
                                        archivePath.string() + ": " +
                                        archiveError(a.get()));
  }

  struct archive_entry *entry;
  for (;;) {
    int r = archive_read_next_header(a.get(), &entry);
    if (r == ARCHIVE_EOF)
      break;
    if (r < ARCHIVE_WARN) {
      throw Error(ErrorKind::ARCHIVE,
                  "Failed to read archive " + archivePath.string() + ": " +
                      archiveError(a.get()));
    }
    if (r < ARCHIVE_OK)
      LOG_WARN("Archive header warning: " + archiveError(a.get()));

    const char *path = archive_entry_pathname(entry);
    if (!path || memberName != path) {
      archive_read_data_skip(a.get());
      continue;
    }

    std::ofstream ofs(destFile, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw Error(ErrorKind::IO,
                  "Failed to create " + destFile.string());
    }

    const void *buff;
    size_t size;
    la_int64_t offset;
    for (;;) {
      r = archive_read_data_block(a.get(), &buff, &size, &offset);
      if (r == ARCHIVE_EOF)
        break;
      if (r < ARCHIVE_WARN) {
        throw Error(ErrorKind::ARCHIVE, "Failed to extract " + memberName +
                                            ": " + archiveError(a.get()));
      }
      ofs.write(static_cast<const char *>(buff),
                static_cast<std::streamsize>(size));
      if (!ofs) {
        throw Error(ErrorKind::IO, "Failed to write " + destFile.string());
      }
    }
    ofs.close();
    if (!ofs)
      throw Error(ErrorKind::IO, "Failed to write " + destFile.string());

    LOG_DEBUG("Extracted " + memberName + " from " + archivePath.string());
    return;
  }

  throw Error(ErrorKind::ARCHIVE, "Failed to find " + memberName +
                                      " in archive " + archivePath.string());
}

} // namespace mplaunch
