#ifndef FDFS_PROTOCOL_PROTOCOL_HEADER_HPP
#define FDFS_PROTOCOL_PROTOCOL_HEADER_HPP

#include <cstddef>
#include <cstdint>

namespace fdfs {
namespace protocol {

// Command codes shared by the tracker and storage protocols
enum class Command : uint8_t {
    STORAGE_UPLOAD_FILE = 11,
    STORAGE_DOWNLOAD_FILE = 14,
    RESPONSE = 100,
    TRACKER_QUERY_STORE_WITHOUT_GROUP_ONE = 101,
    TRACKER_QUERY_FETCH_ONE = 102
};

// Field widths of the fixed-layout parts of requests and responses
constexpr std::size_t PKG_LEN_SIZE = 8;
constexpr std::size_t GROUP_NAME_MAX_LEN = 16;
constexpr std::size_t IP_ADDRESS_SIZE = 16;
constexpr std::size_t FILE_EXT_NAME_MAX_LEN = 6;
constexpr std::size_t REMOTE_FILENAME_MAX_LEN = 128;

// group(16) + ip(15) + port(8), plus the store path index for store queries
constexpr std::size_t TRACKER_QUERY_FETCH_BODY_LEN = GROUP_NAME_MAX_LEN + IP_ADDRESS_SIZE - 1 + PKG_LEN_SIZE;
constexpr std::size_t TRACKER_QUERY_STORE_BODY_LEN = TRACKER_QUERY_FETCH_BODY_LEN + 1;

// Frame header: 8-byte big-endian payload length, command, status
struct ProtocolHeader {
    uint64_t pkg_len{0};
    uint8_t cmd{0};
    uint8_t status{0};

    static constexpr std::size_t SIZE = PKG_LEN_SIZE + 2;
};

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_PROTOCOL_HEADER_HPP
