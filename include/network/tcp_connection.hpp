#ifndef FDFS_NETWORK_TCP_CONNECTION_HPP
#define FDFS_NETWORK_TCP_CONNECTION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "network/connection.hpp"

namespace fdfs {
namespace network {

// Splits "host:port" at the last colon. Throws ConfigError when either part
// is missing or the port is not a number in 1..65535.
void split_address(const std::string& address, std::string& host, uint16_t& port);

class TCP_Connection : public Connection {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // A zero timeout means the operation waits without a deadline
    TCP_Connection(const std::string& address,
                   std::chrono::milliseconds connect_timeout,
                   std::chrono::milliseconds network_timeout);
    ~TCP_Connection() override;


    // ---- CONNECTION MANAGEMENT ----
    // Resolves and connects; throws DialFailed on failure or timeout
    void connect();


    // ---- STREAM OPERATIONS ----
    void write(const void* data, std::size_t size) override;
    void read(void* data, std::size_t size) override;


    // ---- LIFECYCLE ----
    void close() override;
    bool is_open() const override;


    // ---- GETTERS ----
    const std::string& address() const override;

private:
    // ---- PARAMETERS ----
    std::string address_;
    std::string host_;
    uint16_t port_{0};
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds network_timeout_;

    // Network components
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;


    // ---- DEADLINE HANDLING ----
    // Runs the pending asynchronous operation, closing the socket when the
    // deadline expires so the handler completes with operation_aborted.
    // Returns false on timeout.
    bool run_with_deadline(std::chrono::milliseconds timeout);
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_TCP_CONNECTION_HPP
