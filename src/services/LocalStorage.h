#pragma once

#include "../core/Segment.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

// Append-only file handle for an in-progress download.
class PartialFile {
public:
  PartialFile() = default;
  ~PartialFile();

  PartialFile(const PartialFile &) = delete;
  PartialFile &operator=(const PartialFile &) = delete;

  // Opens for appending, or truncates when `truncate` is set. Creates
  // missing parent directories.
  bool open(const std::filesystem::path &path, bool truncate,
            std::string &err);
  bool write(const char *data, std::size_t len, std::string &err);
  // fsync + close.
  bool commit(std::string &err);
  void close();

  bool isOpen() const { return fd_ >= 0; }
  std::uint64_t size() const { return size_; }

private:
  int fd_ = -1;
  std::uint64_t size_ = 0;
  std::filesystem::path path_;
};

// Where segments live on disk: <root>/<relative path> once complete and
// <root>/<relative path>.partial while downloading.
class LocalStorage {
public:
  explicit LocalStorage(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  // Throws std::invalid_argument if the segment's relative path is absolute
  // or climbs out of the root.
  std::filesystem::path finalPath(const Segment &seg) const;
  std::filesystem::path partialPath(const Segment &seg) const;

  bool isComplete(const Segment &seg) const;
  // 0 if there is no partial file.
  std::uint64_t partialSize(const Segment &seg) const;
  void discardPartial(const Segment &seg) const;

  // Renames the partial file to its final path and syncs the directory.
  bool promote(const Segment &seg, std::string &err) const;

  // Hex digest of a file. `algorithm` is an OpenSSL digest name such as
  // "md5", "sha1" or "sha256".
  static bool fileDigest(const std::filesystem::path &path,
                         const std::string &algorithm, std::string &hex,
                         std::string &err);

private:
  std::filesystem::path root_;
};
