#pragma once

#include <filesystem>
#include <memory>
#include <system_error>

#include "internal/storage/shared_store.hpp"
#include "internal/util/time.hpp"

namespace sharedq::storage {

/*
  Shared store on a POSIX filesystem (local disk or a synced network mount).

  Properties:
    - atomic replace writes (temp file + rename)
    - no-clobber renames via link(2) where the filesystem supports hard
      links, falling back to exists-check + rename(2) where it does not
    - modification times from stat(2)
*/
class LocalFsStore final : public SharedStore {
 public:
  // Throws util::StorageIOError if the root cannot be created or accessed.
  explicit LocalFsStore(std::filesystem::path root, StoreOptions options = {}, std::shared_ptr<util::Clock> clock = util::DefaultClock());

  void EnsureDirectory(const std::filesystem::path& dir) override;

  void WriteAtomic(const std::filesystem::path& path, const std::string& bytes, WriteMode mode = WriteMode::kUpsert) override;

  void RenameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) override;

  std::string     Read(const std::filesystem::path& path) override;
  bool            Exists(const std::filesystem::path& path) override;
  util::TimePoint ModifiedAt(const std::filesystem::path& path) override;

  std::vector<std::string> List(const std::filesystem::path& dir, std::string_view suffix) override;

  bool Remove(const std::filesystem::path& path) override;

  std::size_t CleanupTempFiles(const std::filesystem::path& dir, util::Milliseconds older_than) override;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path Resolve(const std::filesystem::path& path) const;

  std::error_code TryRename(const std::filesystem::path& from, const std::filesystem::path& to, bool no_clobber);
  void RenameWithRetry(const std::filesystem::path& from, const std::filesystem::path& to, bool no_clobber);

  std::filesystem::path        root_;
  StoreOptions                 options_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace sharedq::storage
