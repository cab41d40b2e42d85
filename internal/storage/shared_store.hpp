#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace sharedq::storage {

enum class WriteMode {
  kUpsert,   // create or replace
  kCreate,   // util::Conflict if the target already exists
  kReplace,  // util::NotFound if the target no longer exists
};

/*
  Shared storage abstraction.

  Paths are relative to the store root. The backing store is assumed to be
  only eventually consistent: listings may lag, renamed files may briefly
  appear twice or not at all. Callers must therefore treat every call as
  able to fail with a benign "already changed" condition:

    util::NotFound       source vanished (another actor moved it)
    util::Conflict       target already exists
    util::StorageIOError anything else after internal retries

  Implementations:
    LocalFsStore → POSIX filesystem (local disk or a synced mount)
    MemoryStore  → in-process map, used as the fake store in tests
*/
class SharedStore {
 public:
  virtual ~SharedStore() = default;

  virtual void EnsureDirectory(const std::filesystem::path& dir) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Readers never observe a partial file: content goes to a hidden temp file
    in the same directory which is then renamed into place. Only the rename
    is retried on transient failure.
  */
  virtual void WriteAtomic(const std::filesystem::path& path, const std::string& bytes, WriteMode mode = WriteMode::kUpsert) = 0;

  // ------------------------------------------------------------------
  // Rename
  // ------------------------------------------------------------------
  /*
    NotFound if `from` is gone, Conflict if `to` already exists.
  */
  virtual void RenameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::string     Read(const std::filesystem::path& path) = 0;
  virtual bool            Exists(const std::filesystem::path& path) = 0;
  virtual util::TimePoint ModifiedAt(const std::filesystem::path& path) = 0;

  /*
    Snapshot of visible entry names in `dir` ending in `suffix`. Hidden
    entries (leading '.') are never returned. A missing directory is empty.
  */
  virtual std::vector<std::string> List(const std::filesystem::path& dir, std::string_view suffix) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Idempotent. Returns whether anything was removed.
  */
  virtual bool Remove(const std::filesystem::path& path) = 0;

  /*
    Removes orphaned hidden temp files older than `older_than`.
  */
  virtual std::size_t CleanupTempFiles(const std::filesystem::path& dir, util::Milliseconds older_than) = 0;
};

using SharedStorePtr = std::shared_ptr<SharedStore>;

/*
  Rename retry settings shared by the implementations.
*/
struct StoreOptions {
  uint32_t           rename_retries = 3;
  util::Milliseconds rename_retry_delay{50};
};

} // namespace sharedq::storage
