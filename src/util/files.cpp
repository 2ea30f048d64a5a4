// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/time.hpp"
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <unistd.h>

namespace offsync {
namespace util {

namespace {

// Refuse to slurp anything larger; protects against memory exhaustion
constexpr std::streamsize kMaxFileSize = 100 * 1024 * 1024;

bool sync_directory(const std::filesystem::path &dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  // Handle partial writes
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      remove_quietly(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    remove_quietly(temp_path);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    remove_quietly(temp_path);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    remove_quietly(temp_path);
    return false;
  }

  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return std::nullopt;
  }

  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0 || size > kMaxFileSize) {
    return std::nullopt;
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);
  if (!file) {
    return std::nullopt;
  }

  return data;
}

std::optional<std::filesystem::path> quarantine_file(const std::filesystem::path &path) {
  auto target = path;
  target += ".corrupt." + std::to_string(GetTimeMillis());

  std::error_code ec;
  std::filesystem::rename(path, target, ec);
  if (ec) {
    return std::nullopt;
  }
  return target;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".offsync";
  }

  return std::filesystem::current_path() / ".offsync";
}

} // namespace util
} // namespace offsync
