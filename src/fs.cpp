#include "aiblame/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <zlib.h>

namespace aiblame::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = data.size() * 3;
  cap = std::max<size_t>(cap, 64);
  for (int i = 0; i < 12; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto destLen = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &destLen, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(destLen);
      return out;
    }
    if (rc == Z_BUF_ERROR) {
      cap *= 2;
      continue;
    }
    throw std::runtime_error("zlib uncompress failed");
  }
  throw std::runtime_error("zlib uncompress overflow");
}

std::vector<std::uint8_t> z_inflate_prefix(std::span<const std::uint8_t> data,
                                           std::size_t expected_size) {
  std::vector<std::uint8_t> out(expected_size);
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  // inflate needs a non-null output buffer even for empty objects
  std::uint8_t sink = 0;
  zs.next_out = expected_size ? out.data() : &sink;
  zs.avail_out = expected_size ? static_cast<uInt>(expected_size) : 1U;
  const int rc = inflate(&zs, Z_FINISH);
  const auto produced = static_cast<std::size_t>(zs.total_out);
  inflateEnd(&zs);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib inflate failed");
  if (produced != expected_size)
    throw std::runtime_error("zlib inflate: size mismatch");
  return out;
}

// LockFile

LockFile::LockFile(std::filesystem::path p, int fd) : path_(std::move(p)), fd_(fd) {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    ::close(fd_);
    fd_ = -1;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    throw std::runtime_error("cannot stat lock " + path_.string());
  }
  dev_ = static_cast<std::uint64_t>(st.st_dev);
  ino_ = static_cast<std::uint64_t>(st.st_ino);
}

bool LockFile::owned() const {
  if (fd_ < 0)
    return false;
  struct stat st {};
  return ::stat(path_.c_str(), &st) == 0 && static_cast<std::uint64_t>(st.st_dev) == dev_ &&
         static_cast<std::uint64_t>(st.st_ino) == ino_;
}

std::optional<LockFile> LockFile::try_acquire(const std::filesystem::path &lock_path) {
  ensure_parent_dir(lock_path);
  const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST)
      return std::nullopt;
    throw std::runtime_error("cannot create lock " + lock_path.string() + ": " +
                             std::strerror(errno));
  }
  LockFile lock{lock_path, fd};
  lock.write(std::to_string(::getpid()) + "\n");
  return lock;
}

LockFile LockFile::acquire(const std::filesystem::path &lock_path,
                           std::chrono::milliseconds timeout) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;
  auto backoff = std::chrono::milliseconds(1);
  for (;;) {
    if (auto lock = try_acquire(lock_path))
      return std::move(*lock);
    if (clock::now() >= deadline)
      break;
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, std::chrono::milliseconds(50));
  }

  std::cerr << "ai-blame: lock " << lock_path.string() << " held for more than "
            << timeout.count() << " ms; treating it as stale and taking it over\n";
  std::error_code ec;
  std::filesystem::remove(lock_path, ec);
  if (auto lock = try_acquire(lock_path))
    return std::move(*lock);
  throw std::runtime_error("could not acquire lock " + lock_path.string());
}

LockFile::LockFile(LockFile &&other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)), dev_(other.dev_),
      ino_(other.ino_) {}

LockFile &LockFile::operator=(LockFile &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
    dev_ = other.dev_;
    ino_ = other.ino_;
  }
  return *this;
}

LockFile::~LockFile() { release(); }

void LockFile::write(std::string_view text) {
  if (fd_ < 0)
    throw std::runtime_error("lock already released: " + path_.string());
  if (::ftruncate(fd_, 0) != 0 || ::lseek(fd_, 0, SEEK_SET) != 0)
    throw std::runtime_error("cannot rewrite lock " + path_.string());
  std::size_t off = 0;
  while (off < text.size()) {
    const ssize_t n = ::write(fd_, text.data() + off, text.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("write to lock failed: " + path_.string());
    }
    off += static_cast<std::size_t>(n);
  }
}

void LockFile::commit_to(const std::filesystem::path &target) {
  if (fd_ < 0)
    throw std::runtime_error("lock already released: " + path_.string());
  if (::fsync(fd_) != 0)
    throw std::runtime_error("fsync failed: " + path_.string());
  if (!owned()) {
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error("lock " + path_.string() + " was taken over by another process");
  }
  ::close(fd_);
  fd_ = -1;
  ensure_parent_dir(target);
  std::error_code ec;
  std::filesystem::rename(path_, target, ec);
  if (ec) {
    std::filesystem::remove(path_, ec);
    throw std::runtime_error("cannot rename lock over " + target.string());
  }
}

void LockFile::release() noexcept {
  if (fd_ < 0)
    return;
  // fd_ still pins the inode here, so a successor cannot share its number.
  const bool mine = owned();
  ::close(fd_);
  fd_ = -1;
  if (mine) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
}

} // namespace aiblame::fs
