#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "internal/storage/shared_store.hpp"
#include "internal/util/time.hpp"

namespace sharedq::storage {

/*
  In-process shared store.

  Same contract as LocalFsStore, with modification times taken from the
  injected clock. Used as the fake store in tests, with hooks to inject
  transient rename failures and to plant raw files.
*/
class MemoryStore final : public SharedStore {
 public:
  explicit MemoryStore(std::shared_ptr<util::Clock> clock = util::DefaultClock(), StoreOptions options = {});

  void EnsureDirectory(const std::filesystem::path& dir) override;

  void WriteAtomic(const std::filesystem::path& path, const std::string& bytes, WriteMode mode = WriteMode::kUpsert) override;

  void RenameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) override;

  std::string     Read(const std::filesystem::path& path) override;
  bool            Exists(const std::filesystem::path& path) override;
  util::TimePoint ModifiedAt(const std::filesystem::path& path) override;

  std::vector<std::string> List(const std::filesystem::path& dir, std::string_view suffix) override;

  bool Remove(const std::filesystem::path& path) override;

  std::size_t CleanupTempFiles(const std::filesystem::path& dir, util::Milliseconds older_than) override;

  // ------------------------------------------------------------------
  // Test hooks
  // ------------------------------------------------------------------
  // The next `count` rename attempts fail transiently.
  void FailNextRenames(uint32_t count);

  // Plain (non-atomic) write, bypassing every precondition.
  void Put(const std::filesystem::path& path, const std::string& bytes);
  void SetModifiedAt(const std::filesystem::path& path, util::TimePoint when);

  // Every stored path, sorted.
  std::vector<std::string> Paths() const;

 private:
  struct Entry {
    std::string     bytes;
    util::TimePoint modified_at;
  };

  static std::string Key(const std::filesystem::path& path);

  // Called with mutex_ held. Returns false if the attempt "failed".
  bool ConsumeRenameAttempt();
  void RenameLocked(std::unique_lock<std::mutex>& lock, const std::string& what);

  std::shared_ptr<util::Clock> clock_;
  StoreOptions                 options_;

  mutable std::mutex           mutex_;
  std::map<std::string, Entry> files_;
  std::set<std::string>        dirs_;
  uint32_t                     failing_renames_ = 0;
};

} // namespace sharedq::storage
