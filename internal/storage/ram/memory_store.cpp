#include "memory_store.hpp"

#include <algorithm>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::storage {

using namespace sharedq::storage::common;

MemoryStore::MemoryStore(std::shared_ptr<util::Clock> clock, StoreOptions options) : clock_(std::move(clock)), options_(options) {
}

std::string MemoryStore::Key(const std::filesystem::path& path) {
  return path.lexically_normal().generic_string();
}

bool MemoryStore::ConsumeRenameAttempt() {
  if (failing_renames_ == 0) return true;
  --failing_renames_;
  return false;
}

/*
  Mirrors LocalFsStore's bounded rename retry. The lock is dropped while
  "sleeping" so other actors can interleave.
*/
void MemoryStore::RenameLocked(std::unique_lock<std::mutex>& lock, const std::string& what) {
  const uint32_t attempts = std::max<uint32_t>(options_.rename_retries, 1);
  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (ConsumeRenameAttempt()) return;
    if (attempt + 1 < attempts) {
      lock.unlock();
      clock_->SleepFor(options_.rename_retry_delay * (attempt + 1));
      lock.lock();
    }
  }
  throw util::StorageIOError("rename failed: " + what);
}

void MemoryStore::EnsureDirectory(const std::filesystem::path& dir) {
  std::lock_guard lock(mutex_);
  dirs_.insert(Key(dir));
}

void MemoryStore::WriteAtomic(const std::filesystem::path& path, const std::string& bytes, WriteMode mode) {
  const auto key = Key(path);

  std::unique_lock lock(mutex_);
  RenameLocked(lock, key);

  const bool exists = files_.count(key) > 0;
  if (mode == WriteMode::kCreate && exists) {
    throw util::Conflict("target already exists: " + key);
  }
  if (mode == WriteMode::kReplace && !exists) {
    throw util::NotFound("target no longer exists: " + key);
  }

  files_[key] = Entry{bytes, clock_->Now()};
}

void MemoryStore::RenameAtomic(const std::filesystem::path& from, const std::filesystem::path& to) {
  const auto from_key = Key(from);
  const auto to_key   = Key(to);

  std::unique_lock lock(mutex_);
  if (files_.count(from_key) == 0) {
    throw util::NotFound("source no longer exists: " + from_key);
  }

  RenameLocked(lock, from_key + " -> " + to_key);

  auto it = files_.find(from_key);
  if (it == files_.end()) {
    throw util::NotFound("source no longer exists: " + from_key);
  }
  if (files_.count(to_key) > 0) {
    throw util::Conflict("target already exists: " + to_key);
  }

  files_[to_key] = std::move(it->second);
  files_.erase(from_key);
}

std::string MemoryStore::Read(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(Key(path));
  if (it == files_.end()) {
    throw util::NotFound("no such file: " + Key(path));
  }
  return it->second.bytes;
}

bool MemoryStore::Exists(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  return files_.count(Key(path)) > 0;
}

util::TimePoint MemoryStore::ModifiedAt(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(Key(path));
  if (it == files_.end()) {
    throw util::NotFound("no such file: " + Key(path));
  }
  return it->second.modified_at;
}

std::vector<std::string> MemoryStore::List(const std::filesystem::path& dir, std::string_view suffix) {
  const auto prefix = Key(dir) + "/";

  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  for (auto it = files_.lower_bound(prefix); it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    const auto name = it->first.substr(prefix.size());
    if (name.find('/') != std::string::npos) continue;
    if (IsHidden(name) || !EndsWith(name, suffix)) continue;
    names.push_back(name);
  }
  return names;
}

bool MemoryStore::Remove(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  return files_.erase(Key(path)) > 0;
}

std::size_t MemoryStore::CleanupTempFiles(const std::filesystem::path& dir, util::Milliseconds older_than) {
  const auto prefix = Key(dir) + "/";
  const auto now    = clock_->Now();

  std::lock_guard lock(mutex_);
  std::size_t     removed = 0;
  for (auto it = files_.lower_bound(prefix); it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0;) {
    const auto name = it->first.substr(prefix.size());
    if (name.find('/') == std::string::npos && IsTempName(name) && now - it->second.modified_at > older_than) {
      it = files_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  return removed;
}

void MemoryStore::FailNextRenames(uint32_t count) {
  std::lock_guard lock(mutex_);
  failing_renames_ = count;
}

void MemoryStore::Put(const std::filesystem::path& path, const std::string& bytes) {
  std::lock_guard lock(mutex_);
  files_[Key(path)] = Entry{bytes, clock_->Now()};
}

void MemoryStore::SetModifiedAt(const std::filesystem::path& path, util::TimePoint when) {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(Key(path));
  if (it == files_.end()) {
    throw util::NotFound("no such file: " + Key(path));
  }
  it->second.modified_at = when;
}

std::vector<std::string> MemoryStore::Paths() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> paths;
  paths.reserve(files_.size());
  for (const auto& [path, entry] : files_) {
    paths.push_back(path);
  }
  return paths;
}

} // namespace sharedq::storage
