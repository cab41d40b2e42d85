#include "local_fs_store.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::storage {

using namespace sharedq::storage::common;
using observability::StringField;

namespace {

bool IsLinkUnsupported(int err) {
  return err == EPERM || err == EXDEV || err == ENOTSUP || err == EOPNOTSUPP || err == EMLINK || err == ENOSYS;
}

bool PathExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace

LocalFsStore::LocalFsStore(std::filesystem::path root, StoreOptions options, std::shared_ptr<util::Clock> clock)
    : root_(std::move(root)), options_(options), clock_(std::move(clock)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec || !std::filesystem::is_directory(root_, ec)) {
    throw util::StorageIOError("storage root is not accessible: " + root_.string() + (ec ? ": " + ec.message() : ""));
  }
}

std::filesystem::path LocalFsStore::Resolve(const std::filesystem::path& path) const {
  return root_ / path;
}

void LocalFsStore::EnsureDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(Resolve(dir), ec);
  if (ec) {
    throw util::StorageIOError("cannot create directory " + dir.string() + ": " + ec.message());
  }
}

/*
  One rename attempt.

  Returns an empty error_code on success and the failure otherwise. Raises
  NotFound / Conflict for the outcomes that must not be retried.
*/
std::error_code LocalFsStore::TryRename(const std::filesystem::path& from, const std::filesystem::path& to, bool no_clobber) {
  if (no_clobber) {
    if (::link(from.c_str(), to.c_str()) == 0) {
      if (::unlink(from.c_str()) != 0 && errno != ENOENT) {
        SHAREDQ_LOG_WARN("rename left source behind", {StringField("from", from.string()), StringField("to", to.string())});
      }
      return {};
    }

    const int err = errno;
    if (err == EEXIST) {
      throw util::Conflict("target already exists: " + to.string());
    }
    if (err == ENOENT && !PathExists(from)) {
      throw util::NotFound("source no longer exists: " + from.string());
    }
    if (!IsLinkUnsupported(err)) {
      return std::error_code(err, std::generic_category());
    }

    // no hard links on this filesystem
    if (PathExists(to)) {
      throw util::Conflict("target already exists: " + to.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec && ec == std::errc::no_such_file_or_directory && !PathExists(from)) {
    throw util::NotFound("source no longer exists: " + from.string());
  }
  return ec;
}

void LocalFsStore::RenameWithRetry(const std::filesystem::path& from, const std::filesystem::path& to, bool no_clobber) {
  const uint32_t  attempts = std::max<uint32_t>(options_.rename_retries, 1);
  std::error_code last_error;

  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    last_error = TryRename(from, to, no_clobber);
    if (!last_error) return;

    if (attempt + 1 < attempts) {
      clock_->SleepFor(options_.rename_retry_delay * (attempt + 1));
    }
  }

  throw util::StorageIOError("rename " + from.string() + " -> " + to.string() + " failed: " + last_error.message());
}

void LocalFsStore::WriteAtomic(const std::filesystem::path& path, const std::string& bytes, WriteMode mode) {
  const auto target = Resolve(path);
  const auto tmp    = TempPathFor(target);

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::StorageIOError("cannot open temp file for " + path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw util::StorageIOError("short write to temp file for " + path.string());
    }
  }

  try {
    switch (mode) {
      case WriteMode::kCreate:
        RenameWithRetry(tmp, target, true);
        break;
      case WriteMode::kReplace:
        if (!PathExists(target)) {
          throw util::NotFound("target no longer exists: " + path.string());
        }
        RenameWithRetry(tmp, target, false);
        break;
      case WriteMode::kUpsert:
        RenameWithRetry(tmp, target, false);
        break;
    }
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw;
  }
}

void LocalFsStore::RenameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) {
  const auto source = Resolve(from);
  if (!PathExists(source)) {
    throw util::NotFound("source no longer exists: " + from.string());
  }
  RenameWithRetry(source, Resolve(to), true);
}

std::string LocalFsStore::Read(const std::filesystem::path& path) {
  const auto    full = Resolve(path);
  std::ifstream in(full, std::ios::binary);
  if (!in) {
    if (!PathExists(full)) {
      throw util::NotFound("no such file: " + path.string());
    }
    throw util::StorageIOError("cannot read " + path.string());
  }

  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    throw util::StorageIOError("read error on " + path.string());
  }
  return content.str();
}

bool LocalFsStore::Exists(const std::filesystem::path& path) {
  return PathExists(Resolve(path));
}

util::TimePoint LocalFsStore::ModifiedAt(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(Resolve(path).c_str(), &st) != 0) {
    if (errno == ENOENT) {
      throw util::NotFound("no such file: " + path.string());
    }
    throw util::StorageIOError("stat failed on " + path.string() + ": " + std::generic_category().message(errno));
  }

  return util::TimePoint{} + std::chrono::duration_cast<util::SystemClock::duration>(std::chrono::seconds(st.st_mtim.tv_sec) +
                                                                                       std::chrono::nanoseconds(st.st_mtim.tv_nsec));
}

std::vector<std::string> LocalFsStore::List(const std::filesystem::path& dir, std::string_view suffix) {
  const auto full = Resolve(dir);
  if (!PathExists(full)) return {};

  std::vector<std::string> names;
  std::error_code          ec;
  for (std::filesystem::directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (IsHidden(name) || !EndsWith(name, suffix)) continue;

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    names.push_back(name);
  }

  if (ec) {
    throw util::StorageIOError("cannot list " + dir.string() + ": " + ec.message());
  }

  std::sort(names.begin(), names.end());
  return names;
}

bool LocalFsStore::Remove(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(Resolve(path), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw util::StorageIOError("cannot remove " + path.string() + ": " + ec.message());
  }
  return removed;
}

std::size_t LocalFsStore::CleanupTempFiles(const std::filesystem::path& dir, util::Milliseconds older_than) {
  const auto full = Resolve(dir);
  if (!PathExists(full)) return 0;

  const auto  now     = clock_->Now();
  std::size_t removed = 0;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (!IsTempName(name)) continue;

    try {
      const auto modified = ModifiedAt(dir / name);
      if (now - modified <= older_than) continue;
      if (Remove(dir / name)) {
        ++removed;
        SHAREDQ_LOG_DEBUG("removed orphaned temp file", {StringField("path", (dir / name).string())});
      }
    } catch (const util::NotFound&) {
      continue;
    }
  }

  if (ec) {
    throw util::StorageIOError("cannot list " + dir.string() + ": " + ec.message());
  }
  return removed;
}

} // namespace sharedq::storage
