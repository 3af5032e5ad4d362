#ifndef FDFS_PROTOCOL_CODEC_HPP
#define FDFS_PROTOCOL_CODEC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "protocol/protocol_header.hpp"
#include "network/connection.hpp"

namespace fdfs {
namespace protocol {

// Frame header and fixed-width field encoding shared by every task
class Codec {
public:
  using HeaderBytes = std::array<uint8_t, ProtocolHeader::SIZE>;


  // ---- HEADER ENCODING AND DECODING ----
  static HeaderBytes encode_header(const ProtocolHeader& header);
  static ProtocolHeader decode_header(const HeaderBytes& bytes);


  // ---- CONNECTION OPERATIONS ----
  // Writes a request header with a zero status byte
  static void write_header(network::Connection& connection, uint64_t pkg_len, Command cmd);
  // Reads a response header and validates it. Throws MalformedResponse when
  // the command is not RESPONSE or the length does not fit int64, and
  // RemoteStatusError on a non-zero status before any body is read.
  static ProtocolHeader read_response_header(network::Connection& connection);


  // ---- FIXED-WIDTH FIELDS ----
  // Appends value zero padded or truncated to width bytes
  static void append_fixed_string(std::vector<uint8_t>& output, const std::string& value, std::size_t width);
  // Appends an 8-byte big-endian integer
  static void append_int64(std::vector<uint8_t>& output, uint64_t value);
  // Reads a zero padded text field, stopping at the first NUL
  static std::string parse_fixed_string(const uint8_t* data, std::size_t width);
  static uint64_t parse_int64(const uint8_t* data);

private:
  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }

  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_CODEC_HPP
