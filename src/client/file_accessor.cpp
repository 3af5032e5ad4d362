#include "client/file_accessor.hpp"
#include "protocol/protocol_header.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <fstream>

namespace fdfs {
namespace client {

std::string extract_ext_name(const std::string& path) {
  std::string filename = std::filesystem::path(path).filename().string();
  std::size_t dot_pos = filename.rfind('.');
  if (dot_pos == std::string::npos) {
    return "";
  }
  return filename.substr(dot_pos + 1, protocol::FILE_EXT_NAME_MAX_LEN);
}

FileInfo LocalFileAccessor::open(const std::string& path) {
  BOOST_LOG_TRIVIAL(debug) << "File accessor: Opening local file: " << path;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "File accessor: Not a regular file: " << path;
    throw IOError("no such file: " + path);
  }

  std::uintmax_t file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File accessor: Failed to stat " << path << ": " << ec.message();
    throw IOError("cannot stat " + path + ": " + ec.message());
  }
  if (file_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "File accessor: File is empty: " << path;
    throw IOError("file size is zero: " + path);
  }

  // Open in binary mode so bytes go out unchanged
  auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*stream) {
    BOOST_LOG_TRIVIAL(error) << "File accessor: Failed to open " << path;
    throw IOError("cannot open " + path);
  }

  FileInfo info;
  info.file_size = static_cast<uint64_t>(file_size);
  info.stream = std::move(stream);
  info.ext_name = extract_ext_name(path);

  BOOST_LOG_TRIVIAL(debug) << "File accessor: " << path << " has " << info.file_size
                           << " bytes, ext \"" << info.ext_name << "\"";
  return info;
}

} // namespace client
} // namespace fdfs
