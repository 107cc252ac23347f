#include "file_io.hpp"
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include "posix_fd.hpp"

// Read-only mapping of a whole file; empty files map to nothing.
class MappedFile {
public:
  bool open(const std::filesystem::path& path, std::string& msg) {
    fd_.reset(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd_.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
    struct stat st{};
    if (::fstat(fd_.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
    size_ = static_cast<size_t>(st.st_size);
    if (size_ == 0) return true;
    void* mem = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_.get(), 0);
    if (mem == MAP_FAILED) { size_ = 0; msg = std::string("can not mmap file: ") + path.string(); return false; }
    data_ = static_cast<const char*>(mem);
    (void)::madvise(const_cast<char*>(data_), size_, MADV_SEQUENTIAL);
    return true;
  }
  ~MappedFile() {
    if (data_) ::munmap(const_cast<char*>(data_), size_);
  }
  const char* data() const { return data_; }
  size_t size() const { return size_; }
private:
  UniqueFd fd_;
  const char* data_ = nullptr;
  size_t size_ = 0;
};

bool read_file_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg,
                     size_t max_lines) {
  out_lines.clear();
  MappedFile file;
  if (!file.open(path, msg)) return false;
  const char* data = file.data();
  size_t n = file.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
    start = i + 1;
    if (max_lines > 0 && out_lines.size() >= max_lines) return true;
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
  return true;
}

bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg) {
  MappedFile file;
  if (!file.open(path, msg)) return false;
  out.assign(file.data() ? file.data() : "", file.size());
  return true;
}

bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) { msg = std::string("write file failed: ") + path.parent_path().string(); return false; }
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!ufd.valid()) { msg = std::string("write file failed: ") + tmp.string(); return false; }
  if (!write_all(ufd.get(), data.data(), data.size())) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  return true;
}
