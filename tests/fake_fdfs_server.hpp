#ifndef FDFS_TEST_FAKE_FDFS_SERVER_HPP
#define FDFS_TEST_FAKE_FDFS_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "protocol/codec.hpp"
#include "protocol/protocol_header.hpp"

namespace fdfs {
namespace test {

// Loopback server speaking either the tracker or the storage side of the
// protocol. Each accepted connection is served on its own thread.
class FakeFdfsServer {
public:
    enum class Role { TRACKER, STORAGE };

    explicit FakeFdfsServer(Role role, std::string group_name = "group1")
        : role_(role)
        , group_name_(std::move(group_name))
        , acceptor_(io_context_) {
        boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        do_accept();
        io_thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~FakeFdfsServer() {
        stop();
    }

    FakeFdfsServer(const FakeFdfsServer&) = delete;
    FakeFdfsServer& operator=(const FakeFdfsServer&) = delete;

    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }

        boost::asio::post(io_context_, [this]() {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });
        if (io_thread_.joinable()) {
            io_thread_.join();
        }

        // Wake workers blocked in read
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& socket : sockets_) {
                boost::system::error_code ec;
                socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            }
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    uint16_t port() const { return port_; }
    std::string address() const { return "127.0.0.1:" + std::to_string(port_); }

    // Storage endpoint handed out by a tracker
    void set_storage(uint16_t port, uint8_t store_path_index = 0) {
        storage_port_ = port;
        store_path_index_ = store_path_index;
    }

    // Non-zero makes every reply carry this status and no body
    void set_status(uint8_t status) { status_ = status; }

    std::size_t accepted_count() const { return accepted_.load(); }
    std::size_t request_count() const { return requests_.load(); }

    std::string last_query_filename() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_query_filename_;
    }

    uint8_t last_store_path_index() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_store_path_index_;
    }

    std::size_t file_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.size();
    }

private:
    using tcp = boost::asio::ip::tcp;

    Role role_;
    std::string group_name_;
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    uint16_t port_{0};
    std::thread io_thread_;
    std::atomic<bool> stopped_{false};

    std::atomic<uint16_t> storage_port_{0};
    std::atomic<uint8_t> store_path_index_{0};
    std::atomic<uint8_t> status_{0};
    std::atomic<std::size_t> accepted_{0};
    std::atomic<std::size_t> requests_{0};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<tcp::socket>> sockets_;
    std::vector<std::thread> workers_;
    std::map<std::string, std::string> files_;
    std::size_t next_file_no_{0};
    std::string last_query_filename_;
    uint8_t last_store_path_index_{0};

    void do_accept() {
        auto socket = std::make_shared<tcp::socket>(io_context_);
        acceptor_.async_accept(*socket, [this, socket](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            ++accepted_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sockets_.push_back(socket);
                workers_.emplace_back(&FakeFdfsServer::serve, this, socket);
            }
            do_accept();
        });
    }

    void serve(std::shared_ptr<tcp::socket> socket) {
        while (handle_request(*socket)) {
        }
    }

    bool handle_request(tcp::socket& socket) {
        boost::system::error_code ec;
        protocol::Codec::HeaderBytes header_bytes;
        boost::asio::read(socket, boost::asio::buffer(header_bytes), ec);
        if (ec) {
            return false;
        }

        protocol::ProtocolHeader header = protocol::Codec::decode_header(header_bytes);
        std::string body(header.pkg_len, '\0');
        if (header.pkg_len > 0) {
            boost::asio::read(socket, boost::asio::buffer(&body[0], body.size()), ec);
            if (ec) {
                return false;
            }
        }
        ++requests_;

        if (status_.load() != 0) {
            return send_response(socket, status_.load(), "");
        }

        switch (header.cmd) {
            case static_cast<uint8_t>(protocol::Command::TRACKER_QUERY_STORE_WITHOUT_GROUP_ONE):
                return role_ == Role::TRACKER && send_response(socket, 0, storage_info(true));
            case static_cast<uint8_t>(protocol::Command::TRACKER_QUERY_FETCH_ONE):
                if (role_ != Role::TRACKER || body.size() < protocol::GROUP_NAME_MAX_LEN) {
                    return false;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    last_query_filename_ = body.substr(protocol::GROUP_NAME_MAX_LEN);
                }
                return send_response(socket, 0, storage_info(false));
            case static_cast<uint8_t>(protocol::Command::STORAGE_UPLOAD_FILE):
                return role_ == Role::STORAGE && handle_upload(socket, body);
            case static_cast<uint8_t>(protocol::Command::STORAGE_DOWNLOAD_FILE):
                return role_ == Role::STORAGE && handle_download(socket, body);
            default:
                BOOST_LOG_TRIVIAL(error) << "Fake server: Unknown command " << static_cast<int>(header.cmd);
                return false;
        }
    }

    std::string storage_info(bool with_path_index) const {
        std::vector<uint8_t> out;
        protocol::Codec::append_fixed_string(out, group_name_, protocol::GROUP_NAME_MAX_LEN);
        protocol::Codec::append_fixed_string(out, "127.0.0.1", protocol::IP_ADDRESS_SIZE - 1);
        protocol::Codec::append_int64(out, storage_port_.load());
        if (with_path_index) {
            out.push_back(store_path_index_.load());
        }
        return std::string(out.begin(), out.end());
    }

    bool handle_upload(tcp::socket& socket, const std::string& body) {
        const std::size_t meta_len = 1 + protocol::PKG_LEN_SIZE + protocol::FILE_EXT_NAME_MAX_LEN;
        if (body.size() < meta_len) {
            return false;
        }
        const uint8_t* raw = reinterpret_cast<const uint8_t*>(body.data());
        uint64_t file_size = protocol::Codec::parse_int64(raw + 1);
        std::string ext_name = protocol::Codec::parse_fixed_string(raw + 1 + protocol::PKG_LEN_SIZE,
                                                                   protocol::FILE_EXT_NAME_MAX_LEN);
        std::string content = body.substr(meta_len);
        if (content.size() != file_size) {
            return false;
        }

        std::string remote_filename;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_store_path_index_ = raw[0];
            remote_filename = "M00/00/00/file" + std::to_string(next_file_no_++);
            if (!ext_name.empty()) {
                remote_filename += "." + ext_name;
            }
            files_[remote_filename] = content;
        }

        std::vector<uint8_t> out;
        protocol::Codec::append_fixed_string(out, group_name_, protocol::GROUP_NAME_MAX_LEN);
        out.insert(out.end(), remote_filename.begin(), remote_filename.end());
        return send_response(socket, 0, std::string(out.begin(), out.end()));
    }

    bool handle_download(tcp::socket& socket, const std::string& body) {
        const std::size_t fixed_len = protocol::GROUP_NAME_MAX_LEN + 2 * protocol::PKG_LEN_SIZE;
        if (body.size() <= fixed_len) {
            return false;
        }
        const uint8_t* raw = reinterpret_cast<const uint8_t*>(body.data());
        std::string remote_filename = body.substr(protocol::GROUP_NAME_MAX_LEN,
                                                  body.size() - fixed_len);
        uint64_t offset = protocol::Codec::parse_int64(raw + body.size() - 2 * protocol::PKG_LEN_SIZE);
        uint64_t length = protocol::Codec::parse_int64(raw + body.size() - protocol::PKG_LEN_SIZE);

        std::string content;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(remote_filename);
            if (it == files_.end()) {
                return send_response(socket, 2, "");
            }
            content = it->second;
        }

        if (offset > content.size()) {
            return send_response(socket, 22, "");
        }
        content = content.substr(offset, length == 0 ? std::string::npos : length);
        return send_response(socket, 0, content);
    }

    bool send_response(tcp::socket& socket, uint8_t status, const std::string& body) {
        protocol::ProtocolHeader header;
        header.pkg_len = body.size();
        header.cmd = static_cast<uint8_t>(protocol::Command::RESPONSE);
        header.status = status;
        auto header_bytes = protocol::Codec::encode_header(header);

        boost::system::error_code ec;
        boost::asio::write(socket, boost::asio::buffer(header_bytes), ec);
        if (!ec && !body.empty()) {
            boost::asio::write(socket, boost::asio::buffer(body), ec);
        }
        return !ec;
    }
};

} // namespace test
} // namespace fdfs

#endif // FDFS_TEST_FAKE_FDFS_SERVER_HPP
