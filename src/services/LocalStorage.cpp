#include "LocalStorage.h"
#include "../core/Constants.h"
#include "../core/Logger.h"
#include "../core/StringUtils.h"

#include <openssl/evp.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace {

std::string errnoText(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

void syncDirectory(const std::filesystem::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return;
  if (::fsync(fd) != 0)
    LOG_W("LocalStorage", "fsync({}) failed: {}", dir.string(),
          std::strerror(errno));
  ::close(fd);
}

} // namespace

PartialFile::~PartialFile() { close(); }

bool PartialFile::open(const std::filesystem::path &path, bool truncate,
                       std::string &err) {
  close();
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    err = "cannot create " + path.parent_path().string() + ": " + ec.message();
    return false;
  }

  int flags = O_WRONLY | O_CREAT | (truncate ? O_TRUNC : O_APPEND);
  fd_ = ::open(path.c_str(), flags, 0644);
  if (fd_ < 0) {
    err = errnoText("open " + path.string());
    return false;
  }
  struct stat sb;
  if (::fstat(fd_, &sb) != 0) {
    err = errnoText("stat " + path.string());
    close();
    return false;
  }
  size_ = static_cast<std::uint64_t>(sb.st_size);
  path_ = path;
  return true;
}

bool PartialFile::write(const char *data, std::size_t len, std::string &err) {
  while (len > 0) {
    ssize_t n = ::write(fd_, data, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      err = errnoText("write " + path_.string());
      return false;
    }
    data += n;
    len -= static_cast<std::size_t>(n);
    size_ += static_cast<std::uint64_t>(n);
  }
  return true;
}

bool PartialFile::commit(std::string &err) {
  if (fd_ < 0) {
    err = "commit: file not open";
    return false;
  }
  if (::fsync(fd_) != 0) {
    err = errnoText("fsync " + path_.string());
    close();
    return false;
  }
  int rc = ::close(fd_);
  fd_ = -1;
  if (rc != 0) {
    err = errnoText("close " + path_.string());
    return false;
  }
  return true;
}

void PartialFile::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

LocalStorage::LocalStorage(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path LocalStorage::finalPath(const Segment &seg) const {
  std::filesystem::path rel(seg.relativePath.empty() ? seg.id
                                                     : seg.relativePath);
  if (rel.empty() || rel.is_absolute())
    throw std::invalid_argument("bad relative path for " + seg.id);
  for (const auto &part : rel) {
    if (part == "..")
      throw std::invalid_argument("relative path escapes root for " + seg.id);
  }
  return root_ / rel;
}

std::filesystem::path LocalStorage::partialPath(const Segment &seg) const {
  std::filesystem::path p = finalPath(seg);
  p += QIceRadar::PARTIAL_SUFFIX;
  return p;
}

bool LocalStorage::isComplete(const Segment &seg) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(finalPath(seg), ec);
}

std::uint64_t LocalStorage::partialSize(const Segment &seg) const {
  std::error_code ec;
  auto size = std::filesystem::file_size(partialPath(seg), ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

void LocalStorage::discardPartial(const Segment &seg) const {
  std::error_code ec;
  std::filesystem::remove(partialPath(seg), ec);
  if (ec)
    LOG_W("LocalStorage", "Cannot remove partial file for {}: {}", seg.id,
          ec.message());
}

bool LocalStorage::promote(const Segment &seg, std::string &err) const {
  const auto from = partialPath(seg);
  const auto to = finalPath(seg);
  if (::rename(from.c_str(), to.c_str()) != 0) {
    err = errnoText("rename " + from.string());
    return false;
  }
  syncDirectory(to.parent_path());
  return true;
}

bool LocalStorage::fileDigest(const std::filesystem::path &path,
                              const std::string &algorithm, std::string &hex,
                              std::string &err) {
  const EVP_MD *md = EVP_get_digestbyname(algorithm.c_str());
  if (!md) {
    err = "unsupported checksum algorithm '" + algorithm + "'";
    return false;
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    err = "cannot read " + path.string();
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    err = "EVP_DigestInit_ex failed";
    return false;
  }

  std::vector<char> buf(1 << 16);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = ifs.gcount();
    if (n > 0 &&
        EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      err = "EVP_DigestUpdate failed";
      return false;
    }
  }
  if (ifs.bad()) {
    err = "read error on " + path.string();
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    err = "EVP_DigestFinal_ex failed";
    return false;
  }
  hex = StringUtils::toHex(digest, len);
  return true;
}
