#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Inflate one zlib stream that starts at the beginning of `data` and may be
// followed by unrelated bytes (packfile entries). `expected_size` is the
// inflated size announced by the caller; a mismatch is an error.
std::vector<std::uint8_t> z_inflate_prefix(std::span<const std::uint8_t> data,
                                           std::size_t expected_size);

// Exclusive lock file in the style of git's "<name>.lock": created with
// O_CREAT|O_EXCL, removed on destruction unless committed over a target.
class LockFile {
public:
  // Single attempt. Empty if somebody else holds the lock.
  static std::optional<LockFile> try_acquire(const std::filesystem::path& lock_path);

  // Poll until acquired. After `timeout` the lock is considered stale (its
  // owner crashed): it is removed, the recovery is logged, and we take it.
  static LockFile acquire(const std::filesystem::path& lock_path,
                          std::chrono::milliseconds timeout);

  LockFile(LockFile&& other) noexcept;
  LockFile& operator=(LockFile&& other) noexcept;
  LockFile(const LockFile&) = delete;
  LockFile& operator=(const LockFile&) = delete;
  ~LockFile();

  // Replace the lock file's contents.
  void write(std::string_view text);

  // fsync and rename the lock file over `target`. The lock is released.
  void commit_to(const std::filesystem::path& target);

  // Remove the lock file now, unless another process has since taken it over.
  void release() noexcept;

  // Whether the file at the lock path is still the one this object created.
  [[nodiscard]] bool owned() const;

private:
  LockFile(std::filesystem::path p, int fd);

  std::filesystem::path path_;
  int fd_ = -1;
  std::uint64_t dev_ = 0;
  std::uint64_t ino_ = 0;
};

} // namespace aiblame::fs
