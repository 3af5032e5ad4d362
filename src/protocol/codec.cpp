#include "protocol/codec.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <limits>

namespace fdfs {
namespace protocol {

//==============================================
// HEADER ENCODING AND DECODING
//==============================================

Codec::HeaderBytes Codec::encode_header(const ProtocolHeader& header) {
  HeaderBytes bytes{};

  uint64_t network_pkg_len = to_network_order(header.pkg_len);
  std::memcpy(bytes.data(), &network_pkg_len, PKG_LEN_SIZE);
  bytes[PKG_LEN_SIZE] = header.cmd;
  bytes[PKG_LEN_SIZE + 1] = header.status;

  return bytes;
}

ProtocolHeader Codec::decode_header(const HeaderBytes& bytes) {
  ProtocolHeader header;

  uint64_t network_pkg_len;
  std::memcpy(&network_pkg_len, bytes.data(), PKG_LEN_SIZE);
  header.pkg_len = from_network_order(network_pkg_len);
  header.cmd = bytes[PKG_LEN_SIZE];
  header.status = bytes[PKG_LEN_SIZE + 1];

  return header;
}

//==============================================
// CONNECTION OPERATIONS
//==============================================

void Codec::write_header(network::Connection& connection, uint64_t pkg_len, Command cmd) {
  ProtocolHeader header;
  header.pkg_len = pkg_len;
  header.cmd = static_cast<uint8_t>(cmd);

  BOOST_LOG_TRIVIAL(debug) << "Codec: Writing header cmd=" << static_cast<int>(header.cmd)
                           << " pkg_len=" << pkg_len;

  HeaderBytes bytes = encode_header(header);
  connection.write(bytes.data(), bytes.size());
}

ProtocolHeader Codec::read_response_header(network::Connection& connection) {
  HeaderBytes bytes;
  connection.read(bytes.data(), bytes.size());

  ProtocolHeader header = decode_header(bytes);
  BOOST_LOG_TRIVIAL(debug) << "Codec: Read header cmd=" << static_cast<int>(header.cmd)
                           << " status=" << static_cast<int>(header.status)
                           << " pkg_len=" << header.pkg_len;

  if (header.cmd != static_cast<uint8_t>(Command::RESPONSE)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unexpected response command: " << static_cast<int>(header.cmd);
    throw MalformedResponse("unexpected response command " + std::to_string(header.cmd));
  }
  if (header.status != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Remote returned status " << static_cast<int>(header.status);
    throw RemoteStatusError(header.status);
  }
  if (header.pkg_len > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Response length out of range: " << header.pkg_len;
    throw MalformedResponse("response length out of range");
  }

  return header;
}

//==============================================
// FIXED-WIDTH FIELDS
//==============================================

void Codec::append_fixed_string(std::vector<uint8_t>& output, const std::string& value, std::size_t width) {
  std::size_t copy_len = std::min(value.size(), width);
  output.insert(output.end(), value.begin(), value.begin() + copy_len);
  output.insert(output.end(), width - copy_len, 0);
}

void Codec::append_int64(std::vector<uint8_t>& output, uint64_t value) {
  uint64_t network_value = to_network_order(value);
  const uint8_t* raw = reinterpret_cast<const uint8_t*>(&network_value);
  output.insert(output.end(), raw, raw + sizeof(network_value));
}

std::string Codec::parse_fixed_string(const uint8_t* data, std::size_t width) {
  const char* text = reinterpret_cast<const char*>(data);
  std::size_t len = 0;
  while (len < width && text[len] != '\0') {
    ++len;
  }
  return std::string(text, len);
}

uint64_t Codec::parse_int64(const uint8_t* data) {
  uint64_t network_value;
  std::memcpy(&network_value, data, sizeof(network_value));
  return from_network_order(network_value);
}

} // namespace protocol
} // namespace fdfs
