#pragma once
#include "DeviceSession.hpp"
#include "devices/ZkProtocol.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

namespace punchsync {

class ZkLiveStream;

/**
 * @brief TCP session with a ZK-protocol terminal.
 *
 * The constructor connects and authenticates; every socket read is bounded
 * by the session timeout. Not thread-safe.
 */
class ZkSession : public DeviceSession {
public:
    ZkSession(std::string ip, const ConnectOptions& options);
    ~ZkSession() override;

    ZkSession(const ZkSession&) = delete;
    ZkSession& operator=(const ZkSession&) = delete;

    void disable() override;
    void enable() override;
    std::vector<UserRecordRaw> get_users() override;
    std::vector<AttendanceEventRaw> get_attendance() override;
    std::unique_ptr<LiveEventStream> live_capture(std::chrono::seconds timeout) override;
    void set_user(const UserRecord& user) override;
    void delete_user(int64_t uid) override;
    std::string get_time() override;
    void set_time(const std::string& local_time) override;
    DeviceInfo get_info() override;
    void disconnect() override;

    const std::string& ip() const { return ip_; }
    bool connected() const { return connected_; }

private:
    friend class ZkLiveStream;

    struct Response {
        zk::PacketHeader header;
        zk::Bytes payload;
    };

    void open();
    void close_socket();
    boost::system::error_code complete(const boost::system::error_code& result, std::chrono::milliseconds timeout);
    boost::system::error_code read_exact(uint8_t* dst, std::size_t len, std::chrono::milliseconds timeout,
                                         std::size_t& transferred);
    void write_all(const zk::Bytes& frame);

    // nullopt only when `allow_timeout` and nothing arrived before `timeout`.
    std::optional<Response> read_packet(std::chrono::milliseconds timeout, bool allow_timeout);
    Response send_command(uint16_t command, const zk::Bytes& payload = {});
    void expect_ok(const Response& r, const char* what) const;
    void ack_ok();

    zk::FreeSizes read_sizes();
    zk::Bytes read_with_buffer(uint16_t command, uint32_t fct = 0, uint32_t ext = 0);
    zk::Bytes read_chunk(uint32_t start, uint32_t size);
    void free_data();
    void refresh_data();
    void reg_event(uint32_t flags);
    void cancel_capture();
    void verify_user();
    std::string read_option(const std::string& name);

    std::string ip_;
    ConnectOptions options_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
    uint16_t session_id_ = 0;
    uint16_t reply_id_ = zk::USHRT_MAX_VALUE - 1;
    bool connected_ = false;
    bool enabled_ = true;
    std::size_t user_packet_size_ = 72;
};

class ZkConnector : public DeviceConnector {
public:
    std::unique_ptr<DeviceSession> connect(const std::string& ip, const ConnectOptions& options) override;
};

} // namespace punchsync
