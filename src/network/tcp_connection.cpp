#include "network/tcp_connection.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {

void split_address(const std::string& address, std::string& host, uint16_t& port) {
  std::size_t colon_pos = address.rfind(':');
  if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == address.size()) {
    throw ConfigError("invalid address, expected host:port: " + address);
  }

  std::string port_str = address.substr(colon_pos + 1);
  std::size_t consumed = 0;
  int port_value = 0;
  try {
    port_value = std::stoi(port_str, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid port in address: " + address);
  }
  if (consumed != port_str.size() || port_value <= 0 || port_value > 65535) {
    throw ConfigError("invalid port in address: " + address);
  }

  host = address.substr(0, colon_pos);
  port = static_cast<uint16_t>(port_value);
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Connection::TCP_Connection(const std::string& address,
                               std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds network_timeout)
  : address_(address)
  , connect_timeout_(connect_timeout)
  , network_timeout_(network_timeout)
  , socket_(io_context_) {
  split_address(address_, host_, port_);
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: Created connection object for " << address_;
}

TCP_Connection::~TCP_Connection() {
  close();
}

//==============================================
// CONNECTION MANAGEMENT
//==============================================

void TCP_Connection::connect() {
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: Connecting to " << address_;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Failed to resolve " << address_ << ": " << ec.message();
    throw DialFailed(address_, ec.message());
  }

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
    [&result](const boost::system::error_code& connect_ec, const boost::asio::ip::tcp::endpoint&) {
      result = connect_ec;
    });

  if (!run_with_deadline(connect_timeout_)) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Connect to " << address_ << " timed out";
    throw DialFailed(address_, "connect timed out");
  }
  if (result) {
    close();
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Connect to " << address_ << " failed: " << result.message();
    throw DialFailed(address_, result.message());
  }

  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "TCP connection: Failed to set TCP_NODELAY: " << ec.message();
  }

  BOOST_LOG_TRIVIAL(info) << "TCP connection: Connected to " << address_;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void TCP_Connection::write(const void* data, std::size_t size) {
  if (!socket_.is_open()) {
    throw IOError("write on closed connection to " + address_);
  }

  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t transferred = 0;
  boost::asio::async_write(socket_, boost::asio::buffer(data, size),
    [&result, &transferred](const boost::system::error_code& ec, std::size_t bytes) {
      result = ec;
      transferred = bytes;
    });

  if (!run_with_deadline(network_timeout_)) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Write to " << address_ << " timed out";
    throw IOError("write to " + address_ + " timed out");
  }
  if (result || transferred != size) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Short write to " << address_ << ": "
                             << transferred << " of " << size << " bytes";
    throw IOError("short write to " + address_ + ": " + result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP connection: Wrote " << size << " bytes to " << address_;
}

void TCP_Connection::read(void* data, std::size_t size) {
  if (!socket_.is_open()) {
    throw IOError("read on closed connection to " + address_);
  }

  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t transferred = 0;
  boost::asio::async_read(socket_, boost::asio::buffer(data, size),
    [&result, &transferred](const boost::system::error_code& ec, std::size_t bytes) {
      result = ec;
      transferred = bytes;
    });

  if (!run_with_deadline(network_timeout_)) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Read from " << address_ << " timed out";
    throw IOError("read from " + address_ + " timed out");
  }
  if (result || transferred != size) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Short read from " << address_ << ": "
                             << transferred << " of " << size << " bytes";
    throw IOError("short read from " + address_ + ": " + result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP connection: Read " << size << " bytes from " << address_;
}

//==============================================
// LIFECYCLE
//==============================================

void TCP_Connection::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;

    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "TCP connection: Socket shutdown error: " << ec.message();
    }

    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP connection: Socket close error: " << ec.message();
    }
    BOOST_LOG_TRIVIAL(debug) << "TCP connection: Closed connection to " << address_;
  }
}

bool TCP_Connection::is_open() const {
  return socket_.is_open();
}

const std::string& TCP_Connection::address() const {
  return address_;
}

//==============================================
// DEADLINE HANDLING
//==============================================

bool TCP_Connection::run_with_deadline(std::chrono::milliseconds timeout) {
  io_context_.restart();

  if (timeout.count() == 0) {
    io_context_.run();
    return true;
  }

  io_context_.run_for(timeout);
  if (io_context_.stopped()) {
    return true;
  }

  // Deadline expired, abort the operation and let its handler run
  boost::system::error_code ec;
  socket_.close(ec);
  io_context_.run();
  return false;
}

} // namespace network
} // namespace fdfs
