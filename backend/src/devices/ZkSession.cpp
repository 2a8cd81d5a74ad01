#include "devices/ZkSession.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RecordNormalizer.hpp"

#include <algorithm>
#include <deque>
#include <iostream>

namespace punchsync {

namespace {

constexpr uint32_t kMaxPacketSize = 16u * 1024u * 1024u;

} // namespace

// Real-time punches pushed by the terminal after CMD_REG_EVENT.
class ZkLiveStream : public LiveEventStream {
public:
    ZkLiveStream(ZkSession& session, std::chrono::seconds timeout)
        : session_(session), timeout_(timeout), was_enabled_(session.enabled_) {
        users_ = session_.get_users();
        session_.cancel_capture();
        session_.verify_user();
        if (!session_.enabled_) session_.enable();
        session_.reg_event(zk::EF_ATTLOG);
    }

    ~ZkLiveStream() override {
        if (!session_.connected_) return;
        try {
            session_.reg_event(0);
            if (!was_enabled_) session_.disable();
        } catch (const std::exception& e) {
            std::cerr << "ZkSession: " << session_.ip_ << ": live capture teardown failed: " << e.what() << std::endl;
        }
    }

    CaptureItem next() override {
        if (closed_) return CaptureItem::closed();
        if (!pending_.empty()) return pop();

        while (true) {
            std::optional<ZkSession::Response> packet;
            try {
                packet = session_.read_packet(std::chrono::duration_cast<std::chrono::milliseconds>(timeout_), true);
            } catch (const DeviceException&) {
                closed_ = true;
                throw;
            }
            if (!packet) return CaptureItem::timeout();

            session_.ack_ok();
            if (packet->header.command != zk::CMD_REG_EVENT || packet->payload.empty()) continue;

            auto events = zk::parse_live_events(packet->payload, users_);
            if (events.empty()) continue;
            pending_.insert(pending_.end(), events.begin(), events.end());
            return pop();
        }
    }

private:
    CaptureItem pop() {
        auto item = CaptureItem::of(std::move(pending_.front()));
        pending_.pop_front();
        return item;
    }

    ZkSession& session_;
    std::chrono::seconds timeout_;
    bool was_enabled_;
    bool closed_ = false;
    std::vector<UserRecordRaw> users_;
    std::deque<AttendanceEventRaw> pending_;
};

ZkSession::ZkSession(std::string ip, const ConnectOptions& options)
    : ip_(std::move(ip)), options_(options), socket_(io_) {
    open();
}

ZkSession::~ZkSession() {
    close_socket();
}

void ZkSession::close_socket() {
    boost::system::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

boost::system::error_code ZkSession::complete(const boost::system::error_code& result, std::chrono::milliseconds timeout) {
    io_.restart();
    io_.run_for(timeout);
    if (!io_.stopped()) {
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_.restart();
        io_.run();
        if (result == boost::asio::error::operation_aborted) return boost::asio::error::timed_out;
    }
    return result;
}

void ZkSession::open() {
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout);
    const std::string where = ip_ + ":" + std::to_string(options_.port);

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(ip_, ec);
    if (ec) throw device_failure(DeviceErrorKind::Unreachable, ip_ + ": invalid address");

    boost::system::error_code result = boost::asio::error::would_block;
    socket_.async_connect(boost::asio::ip::tcp::endpoint(address, static_cast<unsigned short>(options_.port)),
                          [&result](const boost::system::error_code& e) { result = e; });
    ec = complete(result, timeout);
    if (ec == boost::asio::error::timed_out) {
        close_socket();
        throw device_failure(DeviceErrorKind::Timeout, "connect to " + where);
    }
    if (ec) {
        close_socket();
        throw device_failure(DeviceErrorKind::Unreachable, where + ": " + ec.message());
    }

    session_id_ = 0;
    reply_id_ = zk::USHRT_MAX_VALUE - 1;
    Response r = send_command(zk::CMD_CONNECT);
    session_id_ = r.header.session_id;
    if (r.header.command == zk::CMD_ACK_UNAUTH) {
        r = send_command(zk::CMD_AUTH, zk::make_comm_key(static_cast<uint32_t>(options_.password), session_id_));
    }
    if (r.header.command == zk::CMD_ACK_OK) {
        connected_ = true;
        std::cout << "ZkSession: connected to " << where << " (session " << session_id_ << ")" << std::endl;
        return;
    }
    close_socket();
    if (r.header.command == zk::CMD_ACK_UNAUTH) throw device_failure(DeviceErrorKind::AuthFailed, where);
    throw device_failure(DeviceErrorKind::Protocol,
                         std::string(errors::D3230_UNEXPECTED_REPLY) + " to connect: " + std::to_string(r.header.command));
}

boost::system::error_code ZkSession::read_exact(uint8_t* dst, std::size_t len, std::chrono::milliseconds timeout,
                                                std::size_t& transferred) {
    boost::system::error_code result = boost::asio::error::would_block;
    transferred = 0;
    boost::asio::async_read(socket_, boost::asio::buffer(dst, len),
                            [&](const boost::system::error_code& e, std::size_t n) {
                                result = e;
                                transferred = n;
                            });
    return complete(result, timeout);
}

void ZkSession::write_all(const zk::Bytes& frame) {
    if (!socket_.is_open()) throw device_failure(DeviceErrorKind::Unreachable, ip_ + ": " + errors::D3200_NOT_CONNECTED);
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(frame),
                             [&result](const boost::system::error_code& e, std::size_t) { result = e; });
    auto ec = complete(result, std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout));
    if (ec == boost::asio::error::timed_out) throw device_failure(DeviceErrorKind::Timeout, ip_ + ": send");
    if (ec) throw device_failure(DeviceErrorKind::Unreachable, ip_ + ": send failed: " + ec.message());
}

std::optional<ZkSession::Response> ZkSession::read_packet(std::chrono::milliseconds timeout, bool allow_timeout) {
    uint8_t top[8];
    std::size_t n = 0;
    auto ec = read_exact(top, sizeof(top), timeout, n);
    if (ec == boost::asio::error::timed_out) {
        if (allow_timeout && n == 0) return std::nullopt;
        throw device_failure(DeviceErrorKind::Timeout, ip_ + ": no reply");
    }
    if (ec) throw device_failure(DeviceErrorKind::Unreachable, ip_ + ": connection lost: " + ec.message());

    auto length = zk::tcp_payload_length(top);
    if (!length) throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_BAD_MAGIC);
    if (*length < 8 || *length > kMaxPacketSize) {
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_PACKET);
    }

    zk::Bytes body(*length);
    ec = read_exact(body.data(), body.size(), std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout), n);
    if (ec == boost::asio::error::timed_out) throw device_failure(DeviceErrorKind::Timeout, ip_ + ": partial packet");
    if (ec) throw device_failure(DeviceErrorKind::Unreachable, ip_ + ": connection lost: " + ec.message());

    Response r;
    r.header = zk::parse_header(body);
    r.payload.assign(body.begin() + 8, body.end());
    return r;
}

ZkSession::Response ZkSession::send_command(uint16_t command, const zk::Bytes& payload) {
    write_all(zk::make_tcp_frame(zk::make_header(command, session_id_, reply_id_, payload)));
    auto r = read_packet(std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout), false);
    reply_id_ = r->header.reply_id;
    return std::move(*r);
}

void ZkSession::expect_ok(const Response& r, const char* what) const {
    if (r.header.command != zk::CMD_ACK_OK) {
        throw device_failure(DeviceErrorKind::Rejected,
                             ip_ + ": " + what + " (reply " + std::to_string(r.header.command) + ")");
    }
}

void ZkSession::ack_ok() {
    uint16_t reply = zk::USHRT_MAX_VALUE - 1;
    write_all(zk::make_tcp_frame(zk::make_header(zk::CMD_ACK_OK, session_id_, reply)));
}

zk::FreeSizes ZkSession::read_sizes() {
    auto r = send_command(zk::CMD_GET_FREE_SIZES);
    expect_ok(r, "read sizes");
    if (r.payload.size() < 80) {
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_PACKET + " (free sizes)");
    }
    return zk::parse_free_sizes(r.payload);
}

zk::Bytes ZkSession::read_with_buffer(uint16_t command, uint32_t fct, uint32_t ext) {
    auto r = send_command(zk::CMD_PREPARE_BUFFER, zk::pack_read_buffer_request(command, fct, ext));
    if (r.header.command == zk::CMD_DATA) return std::move(r.payload);
    expect_ok(r, "prepare buffer");
    if (r.payload.size() < 5) {
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_PACKET + " (prepare buffer)");
    }

    const uint32_t size = zk::read_u32(&r.payload[1]);
    zk::Bytes data;
    data.reserve(size);
    for (uint32_t start = 0; start < size; start += zk::MAX_CHUNK) {
        auto part = read_chunk(start, std::min(zk::MAX_CHUNK, size - start));
        data.insert(data.end(), part.begin(), part.end());
    }
    free_data();
    if (data.size() < size) throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_BUFFER);
    return data;
}

zk::Bytes ZkSession::read_chunk(uint32_t start, uint32_t size) {
    zk::Bytes request;
    zk::append_u32(request, start);
    zk::append_u32(request, size);
    auto r = send_command(zk::CMD_READ_BUFFER, request);
    if (r.header.command == zk::CMD_DATA) return std::move(r.payload);
    if (r.header.command != zk::CMD_PREPARE_DATA) {
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_UNEXPECTED_REPLY + " to read buffer: " +
                                                            std::to_string(r.header.command));
    }

    const uint32_t announced = r.payload.size() >= 4 ? zk::read_u32(r.payload.data()) : size;
    zk::Bytes data;
    data.reserve(announced);
    while (true) {
        auto packet = read_packet(std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout), false);
        if (packet->header.command == zk::CMD_DATA) {
            data.insert(data.end(), packet->payload.begin(), packet->payload.end());
            continue;
        }
        if (packet->header.command == zk::CMD_ACK_OK) break;
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_UNEXPECTED_REPLY + " in data stream: " +
                                                            std::to_string(packet->header.command));
    }
    if (data.size() < announced) throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_BUFFER);
    return data;
}

void ZkSession::free_data() {
    expect_ok(send_command(zk::CMD_FREE_DATA), "free data");
}

void ZkSession::refresh_data() {
    expect_ok(send_command(zk::CMD_REFRESHDATA), "refresh data");
}

void ZkSession::reg_event(uint32_t flags) {
    zk::Bytes payload;
    zk::append_u32(payload, flags);
    expect_ok(send_command(zk::CMD_REG_EVENT, payload), "register event");
}

void ZkSession::cancel_capture() {
    auto r = send_command(zk::CMD_CANCELCAPTURE);
    if (r.header.command != zk::CMD_ACK_OK) {
        std::cerr << "ZkSession: " << ip_ << ": cancel capture not acknowledged (reply " << r.header.command << ")" << std::endl;
    }
}

void ZkSession::verify_user() {
    expect_ok(send_command(zk::CMD_STARTVERIFY), "start verify");
}

std::string ZkSession::read_option(const std::string& name) {
    auto r = send_command(zk::CMD_OPTIONS_RRQ, zk::pack_option_request(name));
    expect_ok(r, "read option");
    return zk::parse_option_value(r.payload);
}

void ZkSession::disable() {
    expect_ok(send_command(zk::CMD_DISABLEDEVICE), "disable device");
    enabled_ = false;
}

void ZkSession::enable() {
    expect_ok(send_command(zk::CMD_ENABLEDEVICE), "enable device");
    enabled_ = true;
}

std::vector<UserRecordRaw> ZkSession::get_users() {
    auto sizes = read_sizes();
    if (sizes.users <= 0) return {};
    auto table = zk::parse_users(read_with_buffer(zk::CMD_USERTEMP_RRQ, zk::FCT_USER), sizes.users);
    if (table.record_size) user_packet_size_ = table.record_size;
    return std::move(table.users);
}

std::vector<AttendanceEventRaw> ZkSession::get_attendance() {
    auto sizes = read_sizes();
    if (sizes.records <= 0) return {};
    auto users = get_users();
    return zk::parse_attendance(read_with_buffer(zk::CMD_ATTLOG_RRQ), sizes.records, users);
}

std::unique_ptr<LiveEventStream> ZkSession::live_capture(std::chrono::seconds timeout) {
    return std::make_unique<ZkLiveStream>(*this, timeout);
}

void ZkSession::set_user(const UserRecord& user) {
    expect_ok(send_command(zk::CMD_USER_WRQ, zk::pack_user(user, user_packet_size_)), "set user");
    refresh_data();
}

void ZkSession::delete_user(int64_t uid) {
    require_device_uid(uid);
    zk::Bytes payload;
    zk::append_u16(payload, static_cast<uint16_t>(uid));
    expect_ok(send_command(zk::CMD_DELETE_USER, payload), "delete user");
    refresh_data();
}

std::string ZkSession::get_time() {
    auto r = send_command(zk::CMD_GET_TIME);
    expect_ok(r, "get time");
    if (r.payload.size() < 4) {
        throw device_failure(DeviceErrorKind::Protocol, ip_ + ": " + errors::D3230_SHORT_PACKET + " (time)");
    }
    return zk::decode_time(zk::read_u32(r.payload.data()));
}

void ZkSession::set_time(const std::string& local_time) {
    auto packed = zk::encode_time(local_time);
    if (!packed) throw device_failure(DeviceErrorKind::Rejected, ip_ + ": cannot encode time '" + local_time + "'");
    zk::Bytes payload;
    zk::append_u32(payload, *packed);
    expect_ok(send_command(zk::CMD_SET_TIME, payload), "set time");
}

DeviceInfo ZkSession::get_info() {
    DeviceInfo info;
    auto version = send_command(zk::CMD_GET_VERSION);
    expect_ok(version, "get version");
    info.firmware_version = zk::decode_text(version.payload.data(), version.payload.size());

    info.serial_number = read_option("~SerialNumber");
    info.platform = read_option("~Platform");
    info.device_name = read_option("~DeviceName");
    info.mac = read_option("MAC");
    info.ip_address = read_option("IPAddress");
    info.netmask = read_option("NetMask");
    info.gateway = read_option("GATEIPAddress");
    info.pin_width = static_cast<int>(RecordNormalizer::coerce_int(nlohmann::json(read_option("~PIN2Width"))));
    return info;
}

void ZkSession::disconnect() {
    if (!connected_) return;
    connected_ = false;
    try {
        auto r = send_command(zk::CMD_EXIT);
        close_socket();
        expect_ok(r, "exit");
    } catch (const DeviceException&) {
        close_socket();
        throw;
    }
}

std::unique_ptr<DeviceSession> ZkConnector::connect(const std::string& ip, const ConnectOptions& options) {
    return std::make_unique<ZkSession>(ip, options);
}

} // namespace punchsync
