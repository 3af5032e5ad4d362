#ifndef FDFS_NETWORK_CONNECTION_HPP
#define FDFS_NETWORK_CONNECTION_HPP

#include <cstddef>
#include <string>

namespace fdfs {
namespace network {

// Blocking byte stream to one remote address. Implementations throw
// IOError when fewer bytes than requested could be transferred.
class Connection {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;


    // ---- STREAM OPERATIONS ----
    // Writes exactly size bytes
    virtual void write(const void* data, std::size_t size) = 0;
    // Reads exactly size bytes
    virtual void read(void* data, std::size_t size) = 0;


    // ---- LIFECYCLE ----
    virtual void close() = 0;
    virtual bool is_open() const = 0;


    // ---- GETTERS ----
    virtual const std::string& address() const = 0;

protected:
    Connection() = default;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_CONNECTION_HPP
