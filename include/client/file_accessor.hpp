#ifndef FDFS_CLIENT_FILE_ACCESSOR_HPP
#define FDFS_CLIENT_FILE_ACCESSOR_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace fdfs {
namespace client {

// Local file staged for upload. The stream is closed when the FileInfo is
// destroyed.
struct FileInfo {
  uint64_t file_size{0};
  std::unique_ptr<std::istream> stream;
  std::string ext_name;
};

// Extension after the last '.' of the filename component, at most 6 bytes
std::string extract_ext_name(const std::string& path);

class FileAccessor {
public:
  virtual ~FileAccessor() = default;

  // Opens path for reading. Throws IOError when it does not exist, cannot
  // be opened or is empty.
  virtual FileInfo open(const std::string& path) = 0;
};

class LocalFileAccessor : public FileAccessor {
public:
  FileInfo open(const std::string& path) override;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_FILE_ACCESSOR_HPP
