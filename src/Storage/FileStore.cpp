#include "FileStore.hpp"

#include <cerrno>

namespace jobdl {

namespace {

std::error_code lastError() {
  return std::error_code(errno ? errno : EIO, std::generic_category());
}

class LocalFileWriter final : public FileWriter {
 public:
  explicit LocalFileWriter(std::FILE* fp) : file_(fp) {}

  std::error_code write(const char* data, std::size_t size) override {
    if (!file_) {
      return std::make_error_code(std::errc::bad_file_descriptor);
    }
    errno = 0;
    if (std::fwrite(data, 1, size, file_.get()) != size) {
      return lastError();
    }
    return {};
  }

  std::error_code close() override {
    if (!file_) return {};
    errno = 0;
    int rc = std::fclose(file_.release());
    return rc == 0 ? std::error_code() : lastError();
  }

 private:
  struct FileDeleter {
    void operator()(std::FILE* fp) const noexcept {
      if (fp) {
        std::fclose(fp);
      }
    }
  };

  std::unique_ptr<std::FILE, FileDeleter> file_;
};

}  // namespace

std::unique_ptr<FileWriter> LocalFileStore::open(
    const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return nullptr;
  }

  errno = 0;
  std::FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) {
    ec = lastError();
    return nullptr;
  }
  return std::make_unique<LocalFileWriter>(fp);
}

std::error_code LocalFileStore::remove(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec) && !ec) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
  return ec;
}

}  // namespace jobdl
