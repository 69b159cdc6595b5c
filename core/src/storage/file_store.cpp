#include "pxf/storage/file_store.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <sys/types.h>

namespace pxf::storage {

static std::string errno_text(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

FileSource::~FileSource() {
  close();
}

FileSource::FileSource(FileSource&& other) noexcept
  : f_(other.f_), size_(other.size_), error_(std::move(other.error_)) {
  other.f_ = nullptr;
  other.size_ = 0;
}

FileSource& FileSource::operator=(FileSource&& other) noexcept {
  if (this != &other) {
    close();
    f_ = other.f_;
    size_ = other.size_;
    error_ = std::move(other.error_);
    other.f_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

bool FileSource::open(const std::string& path) {
  close();
  error_.clear();

  f_ = fopen(path.c_str(), "rb");
  if (!f_) {
    error_ = errno_text("cannot open", path);
    return false;
  }

  if (fseeko(f_, 0, SEEK_END) != 0) {
    error_ = errno_text("cannot seek", path);
    close();
    return false;
  }
  off_t end = ftello(f_);
  if (end < 0 || fseeko(f_, 0, SEEK_SET) != 0) {
    error_ = errno_text("cannot size", path);
    close();
    return false;
  }

  size_ = static_cast<uint64_t>(end);
  return true;
}

bool FileSource::read(std::vector<uint8_t>& out, size_t max_len) {
  if (!f_) {
    error_ = "read on closed file";
    return false;
  }
  out.resize(max_len);
  size_t n = fread(out.data(), 1, max_len, f_);
  out.resize(n);
  if (n < max_len && ferror(f_)) {
    error_ = std::string("read failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

void FileSource::close() {
  if (f_) {
    fclose(f_);
    f_ = nullptr;
  }
}

FileSink::~FileSink() {
  close();
}

bool FileSink::open(const std::string& path) {
  close();
  error_.clear();
  written_ = 0;

  f_ = fopen(path.c_str(), "wb");
  if (!f_) {
    error_ = errno_text("cannot open for writing", path);
    return false;
  }
  return true;
}

bool FileSink::write(const std::vector<uint8_t>& data) {
  if (!f_) {
    error_ = "write on closed file";
    return false;
  }
  if (data.empty()) return true;

  size_t n = fwrite(data.data(), 1, data.size(), f_);
  if (n != data.size()) {
    error_ = "partial write (written=" + std::to_string(n) +
             " expected=" + std::to_string(data.size()) + "): " + std::strerror(errno);
    return false;
  }
  written_ += n;
  return true;
}

bool FileSink::close() {
  if (!f_) return true;
  int rc = fclose(f_);
  f_ = nullptr;
  if (rc != 0) {
    error_ = std::string("close failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

FileStore::FileStore(const std::string& base_storage_path)
  : base_path_(base_storage_path) {
}

bool FileStore::initialize() {
  return ensure_directory(base_path_);
}

bool FileStore::ensure_directory(const std::string& path) {
  if (path.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) return false;
  return std::filesystem::is_directory(path, ec);
}

std::string FileStore::destination_path(const std::string& remote_path) const {
  // Remote paths may use either separator.
  auto cut = remote_path.find_last_of("/\\");
  std::string name = cut == std::string::npos ? remote_path : remote_path.substr(cut + 1);
  if (name.empty() || name == "." || name == "..") name = "unnamed";

  if (base_path_.empty()) return name;
  return (std::filesystem::path(base_path_) / name).string();
}

std::string FileStore::reserve_destination(const std::string& remote_path) {
  std::filesystem::path first(destination_path(remote_path));
  std::string stem = first.stem().string();
  std::string ext = first.extension().string();

  std::lock_guard<std::mutex> lock(mu_);
  std::string candidate = first.string();
  for (unsigned n = 1; reserved_.count(candidate) > 0; ++n) {
    candidate = (first.parent_path() / (stem + " (" + std::to_string(n) + ")" + ext)).string();
  }
  reserved_.insert(candidate);
  return candidate;
}

void FileStore::release_destination(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  reserved_.erase(path);
}

bool FileStore::is_reserved(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  return reserved_.count(path) > 0;
}

bool FileStore::remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return !ec;
}

} // namespace pxf::storage
