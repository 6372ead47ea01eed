// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "util/files.hpp"
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace lunachain {
namespace util {

namespace {

// Unique per process and call, so concurrent saves never share a temp file
std::filesystem::path temp_sibling(const std::filesystem::path &path) {
  static std::atomic<uint64_t> counter{0};
  std::filesystem::path temp = path;
  temp += ".tmp." + std::to_string(::getpid()) + "." +
          std::to_string(counter.fetch_add(1));
  return temp;
}

bool write_and_sync(const std::filesystem::path &path, const char *data,
                    size_t len) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return false;
  }
  bool ok = true;
  while (ok && len > 0) {
    ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      ok = false;
      break;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  ok = ok && ::fsync(fd) == 0;
  return ::close(fd) == 0 && ok;
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  const std::filesystem::path parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  const std::filesystem::path temp = temp_sibling(path);
  std::error_code ec;
  if (!write_and_sync(temp, data.data(), data.size())) {
    std::filesystem::remove(temp, ec);
    return false;
  }
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    std::filesystem::remove(temp, ec);
    return false;
  }

  // Persist the rename itself
  if (!parent.empty()) {
    int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
      ::fsync(dir_fd);
      ::close(dir_fd);
    }
  }
  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::string contents{std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>()};
  if (file.bad()) {
    return std::nullopt;
  }
  return contents;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  std::filesystem::path base =
      home ? std::filesystem::path(home) : std::filesystem::current_path();
  return base / ".lunachain";
}

} // namespace util
} // namespace lunachain
