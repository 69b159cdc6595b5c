#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pxf::storage {

// Sequential reader over a local file. Closed on destruction.
class FileSource {
public:
  FileSource() = default;
  ~FileSource();
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;
  FileSource(FileSource&& other) noexcept;
  FileSource& operator=(FileSource&& other) noexcept;

  // Opens path for reading and records its size. Returns false and fills
  // error() on failure.
  bool open(const std::string& path);

  // Reads up to max_len bytes into out (resized to the byte count read).
  // Returns false on a read error; an empty out with true means end of file.
  bool read(std::vector<uint8_t>& out, size_t max_len);

  void close();
  bool is_open() const { return f_ != nullptr; }
  uint64_t size() const { return size_; }
  const std::string& error() const { return error_; }

private:
  FILE* f_ = nullptr;
  uint64_t size_ = 0;
  std::string error_;
};

// Sequential writer with create/truncate semantics. Closed on destruction.
class FileSink {
public:
  FileSink() = default;
  ~FileSink();
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  bool open(const std::string& path);
  bool write(const std::vector<uint8_t>& data);
  bool close();

  bool is_open() const { return f_ != nullptr; }
  uint64_t written() const { return written_; }
  const std::string& error() const { return error_; }

private:
  FILE* f_ = nullptr;
  uint64_t written_ = 0;
  std::string error_;
};

// Maps announced remote paths onto the local download directory.
class FileStore {
public:
  explicit FileStore(const std::string& base_storage_path = "./downloads");

  // Create the download directory if needed
  bool initialize();

  // Destination for an announced path: base / filename(remote_path).
  // Directory components of the remote path are never honoured.
  std::string destination_path(const std::string& remote_path) const;

  // Like destination_path, but never hands out a path another reservation
  // still holds: "x.bin", then "x (1).bin", "x (2).bin", ...
  // Each reservation is held until release_destination().
  std::string reserve_destination(const std::string& remote_path);
  void release_destination(const std::string& path);
  bool is_reserved(const std::string& path) const;

  // Remove a (partial) download; missing files are not an error.
  bool remove_file(const std::string& path);

  const std::string& base_path() const { return base_path_; }

private:
  std::string base_path_;
  mutable std::mutex mu_;
  std::set<std::string> reserved_;

  bool ensure_directory(const std::string& path);
};

} // namespace pxf::storage
