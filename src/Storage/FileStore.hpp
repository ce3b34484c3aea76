#ifndef JOBDL_FILE_STORE_HPP_
#define JOBDL_FILE_STORE_HPP_

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>

namespace jobdl {

class FileWriter {
 public:
  virtual ~FileWriter() = default;

  // Appends all of [data, data + size) or reports why it could not.
  virtual std::error_code write(const char* data, std::size_t size) = 0;
  virtual std::error_code close() = 0;
};

class FileStore {
 public:
  virtual ~FileStore() = default;

  // Truncates or creates the file. Returns nullptr and sets ec on failure.
  virtual std::unique_ptr<FileWriter> open(const std::filesystem::path& path,
                                           std::error_code& ec) = 0;
  // A missing file is reported as std::errc::no_such_file_or_directory.
  virtual std::error_code remove(const std::filesystem::path& path) = 0;
};

// stdio-backed store; parent directories are created on open.
class LocalFileStore final : public FileStore {
 public:
  std::unique_ptr<FileWriter> open(const std::filesystem::path& path,
                                   std::error_code& ec) override;
  std::error_code remove(const std::filesystem::path& path) override;
};

}  // namespace jobdl

#endif  // JOBDL_FILE_STORE_HPP_
