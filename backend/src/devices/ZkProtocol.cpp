#include "devices/ZkProtocol.hpp"
#include "DeviceSession.hpp"
#include "core/RecordNormalizer.hpp"

#include <algorithm>
#include <cstdio>

using nlohmann::json;

namespace punchsync::zk {

namespace {

std::string strip(const std::string& s) {
    return RecordNormalizer::trim(s);
}

void append_fixed(Bytes& out, const std::string& s, std::size_t width) {
    std::size_t n = std::min(s.size(), width);
    out.insert(out.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(n));
    out.insert(out.end(), width - n, 0);
}

const UserRecordRaw* find_by_uid(const std::vector<UserRecordRaw>& users, int64_t uid) {
    for (const auto& u : users) {
        if (RecordNormalizer::coerce_int(u.uid, -1) == uid) return &u;
    }
    return nullptr;
}

const UserRecordRaw* find_by_user_id(const std::vector<UserRecordRaw>& users, const std::string& user_id) {
    for (const auto& u : users) {
        if (u.user_id.is_string() && u.user_id.get<std::string>() == user_id) return &u;
    }
    return nullptr;
}

AttendanceEventRaw make_event(json uid, const std::string& user_id, std::string timestamp, int status, int punch) {
    AttendanceEventRaw ev;
    ev.uid = std::move(uid);
    ev.user_id = user_id;
    ev.timestamp = std::move(timestamp);
    ev.status = status;
    ev.punch = punch;
    return ev;
}

} // namespace

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void append_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void append_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

uint16_t checksum(const Bytes& data) {
    int64_t sum = 0;
    std::size_t i = 0;
    for (; i + 1 < data.size(); i += 2) {
        sum += read_u16(&data[i]);
        if (sum > USHRT_MAX_VALUE) sum -= USHRT_MAX_VALUE;
    }
    if (i < data.size()) sum += data[i];
    while (sum > USHRT_MAX_VALUE) sum -= USHRT_MAX_VALUE;
    sum = ~sum;
    while (sum < 0) sum += USHRT_MAX_VALUE;
    return static_cast<uint16_t>(sum);
}

Bytes make_header(uint16_t command, uint16_t session_id, uint16_t& reply_id, const Bytes& payload) {
    Bytes buf;
    buf.reserve(8 + payload.size());
    append_u16(buf, command);
    append_u16(buf, 0);
    append_u16(buf, session_id);
    append_u16(buf, reply_id);
    buf.insert(buf.end(), payload.begin(), payload.end());
    const uint16_t sum = checksum(buf);

    uint32_t next = static_cast<uint32_t>(reply_id) + 1;
    if (next >= USHRT_MAX_VALUE) next -= USHRT_MAX_VALUE;
    reply_id = static_cast<uint16_t>(next);

    buf[2] = static_cast<uint8_t>(sum & 0xFF);
    buf[3] = static_cast<uint8_t>(sum >> 8);
    buf[6] = static_cast<uint8_t>(reply_id & 0xFF);
    buf[7] = static_cast<uint8_t>(reply_id >> 8);
    return buf;
}

Bytes make_tcp_frame(const Bytes& packet) {
    Bytes out;
    out.reserve(8 + packet.size());
    append_u16(out, MACHINE_PREPARE_DATA_1);
    append_u16(out, MACHINE_PREPARE_DATA_2);
    append_u32(out, static_cast<uint32_t>(packet.size()));
    out.insert(out.end(), packet.begin(), packet.end());
    return out;
}

std::optional<uint32_t> tcp_payload_length(const uint8_t* top) {
    if (read_u16(top) != MACHINE_PREPARE_DATA_1 || read_u16(top + 2) != MACHINE_PREPARE_DATA_2) return std::nullopt;
    return read_u32(top + 4);
}

PacketHeader parse_header(const Bytes& packet) {
    PacketHeader h;
    if (packet.size() < 8) return h;
    h.command = read_u16(&packet[0]);
    h.checksum = read_u16(&packet[2]);
    h.session_id = read_u16(&packet[4]);
    h.reply_id = read_u16(&packet[6]);
    return h;
}

Bytes make_comm_key(uint32_t key, uint16_t session_id, uint8_t ticks) {
    uint32_t k = 0;
    for (int i = 0; i < 32; ++i) {
        k = (key & (1u << i)) ? ((k << 1) | 1u) : (k << 1);
    }
    k += session_id;

    uint8_t b[4] = {
        static_cast<uint8_t>((k & 0xFF) ^ 'Z'),
        static_cast<uint8_t>(((k >> 8) & 0xFF) ^ 'K'),
        static_cast<uint8_t>(((k >> 16) & 0xFF) ^ 'S'),
        static_cast<uint8_t>(((k >> 24) & 0xFF) ^ 'O'),
    };
    // swap the two 16-bit halves
    uint8_t s[4] = {b[2], b[3], b[0], b[1]};
    return Bytes{
        static_cast<uint8_t>(s[0] ^ ticks),
        static_cast<uint8_t>(s[1] ^ ticks),
        ticks,
        static_cast<uint8_t>(s[3] ^ ticks),
    };
}

std::string decode_time(uint32_t t) {
    const unsigned second = t % 60;
    t /= 60;
    const unsigned minute = t % 60;
    t /= 60;
    const unsigned hour = t % 24;
    t /= 24;
    const unsigned day = t % 31 + 1;
    t /= 31;
    const unsigned month = t % 12 + 1;
    t /= 12;
    const unsigned year = t + 2000;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u", year, month, day, hour, minute, second);
    return buf;
}

std::optional<uint32_t> encode_time(const std::string& local_time) {
    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(local_time.c_str(), "%4u-%2u-%2u %2u:%2u:%2u%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        static_cast<std::size_t>(consumed) != local_time.size()) {
        return std::nullopt;
    }
    if (year < 2000 || year > 2099 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    const uint32_t days = ((year % 100) * 12 + (month - 1)) * 31 + (day - 1);
    return days * 86400u + (hour * 60 + minute) * 60 + second;
}

std::string decode_time_hex(const uint8_t* six) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u",
                  six[0] + 2000u, unsigned(six[1]), unsigned(six[2]),
                  unsigned(six[3]), unsigned(six[4]), unsigned(six[5]));
    return buf;
}

std::string decode_text(const uint8_t* p, std::size_t len) {
    std::size_t end = 0;
    while (end < len && p[end] != 0) ++end;

    std::string out;
    out.reserve(end);
    std::size_t i = 0;
    while (i < end) {
        const uint8_t c = p[i];
        std::size_t n = 0;
        if (c < 0x80) n = 1;
        else if (c >= 0xC2 && c <= 0xDF) n = 2;
        else if (c >= 0xE0 && c <= 0xEF) n = 3;
        else if (c >= 0xF0 && c <= 0xF4) n = 4;

        bool ok = n > 0 && i + n <= end;
        for (std::size_t k = 1; ok && k < n; ++k) ok = (p[i + k] & 0xC0) == 0x80;
        if (ok && n >= 3) {
            const uint8_t c1 = p[i + 1];
            if (c == 0xE0 && c1 < 0xA0) ok = false;
            if (c == 0xED && c1 >= 0xA0) ok = false;
            if (c == 0xF0 && c1 < 0x90) ok = false;
            if (c == 0xF4 && c1 >= 0x90) ok = false;
        }
        if (ok) {
            out.append(reinterpret_cast<const char*>(p + i), n);
            i += n;
        } else {
            ++i;
        }
    }
    return out;
}

FreeSizes parse_free_sizes(const Bytes& payload) {
    FreeSizes sizes;
    if (payload.size() < 80) return sizes;
    sizes.users = static_cast<int32_t>(read_u32(&payload[4 * 4]));
    sizes.records = static_cast<int32_t>(read_u32(&payload[8 * 4]));
    return sizes;
}

Bytes pack_option_request(const std::string& name) {
    Bytes out(name.begin(), name.end());
    out.push_back(0);
    return out;
}

std::string parse_option_value(const Bytes& payload) {
    const std::string text = decode_text(payload.data(), payload.size());
    const auto eq = text.find('=');
    return strip(eq == std::string::npos ? text : text.substr(eq + 1));
}

UserTable parse_users(const Bytes& data, int32_t user_count) {
    UserTable table;
    if (data.size() < 4 || user_count <= 0) return table;

    const uint32_t total = read_u32(data.data());
    const std::size_t record_size = total / static_cast<uint32_t>(user_count);
    const uint8_t* p = data.data() + 4;
    std::size_t remaining = data.size() - 4;

    if (record_size == 28) {
        table.record_size = 28;
        while (remaining >= 28) {
            const std::string user_id = std::to_string(read_u32(p + 24));
            std::string name = strip(decode_text(p + 8, 8));
            if (name.empty()) name = "NN-" + user_id;

            UserRecordRaw u;
            u.uid = read_u16(p);
            u.privilege = p[2];
            u.password = decode_text(p + 3, 5);
            u.name = name;
            u.card = read_u32(p + 16);
            u.group_id = std::to_string(p[21]);
            u.user_id = user_id;
            table.users.push_back(std::move(u));
            p += 28;
            remaining -= 28;
        }
    } else {
        table.record_size = 72;
        while (remaining >= 72) {
            const std::string user_id = decode_text(p + 48, 24);
            std::string name = strip(decode_text(p + 11, 24));
            if (name.empty()) name = "NN-" + user_id;

            UserRecordRaw u;
            u.uid = read_u16(p);
            u.privilege = p[2];
            u.password = decode_text(p + 3, 8);
            u.name = name;
            u.card = read_u32(p + 35);
            u.group_id = decode_text(p + 40, 7);
            u.user_id = user_id;
            table.users.push_back(std::move(u));
            p += 72;
            remaining -= 72;
        }
    }
    return table;
}

std::vector<AttendanceEventRaw> parse_attendance(const Bytes& data, int32_t record_count,
                                                 const std::vector<UserRecordRaw>& users) {
    std::vector<AttendanceEventRaw> out;
    if (data.size() < 4 || record_count <= 0) return out;

    const uint32_t total = read_u32(data.data());
    const std::size_t record_size = total / static_cast<uint32_t>(record_count);
    const uint8_t* p = data.data() + 4;
    std::size_t remaining = data.size() - 4;

    if (record_size == 8) {
        while (remaining >= 8) {
            const uint16_t uid = read_u16(p);
            const auto* user = find_by_uid(users, uid);
            std::string user_id = user && user->user_id.is_string() ? user->user_id.get<std::string>() : std::to_string(uid);
            out.push_back(make_event(uid, user_id, decode_time(read_u32(p + 3)), p[2], p[7]));
            p += 8;
            remaining -= 8;
        }
    } else if (record_size == 16) {
        while (remaining >= 16) {
            const std::string user_id = std::to_string(read_u32(p));
            const auto* user = find_by_user_id(users, user_id);
            json uid = user ? user->uid : json(read_u32(p));
            out.push_back(make_event(uid, user_id, decode_time(read_u32(p + 4)), p[8], p[9]));
            p += 16;
            remaining -= 16;
        }
    } else {
        const std::size_t step = std::max<std::size_t>(record_size, 40);
        while (remaining >= 40) {
            const std::string user_id = decode_text(p + 2, 24);
            out.push_back(make_event(read_u16(p), user_id, decode_time(read_u32(p + 27)), p[26], p[31]));
            if (remaining < step) break;
            p += step;
            remaining -= step;
        }
    }
    return out;
}

std::vector<AttendanceEventRaw> parse_live_events(const Bytes& payload, const std::vector<UserRecordRaw>& users) {
    std::vector<AttendanceEventRaw> out;
    std::size_t pos = 0;
    while (payload.size() - pos >= 10) {
        const uint8_t* p = payload.data() + pos;
        const std::size_t rem = payload.size() - pos;

        std::string user_id;
        uint8_t status = 0;
        uint8_t punch = 0;
        const uint8_t* timehex = nullptr;
        std::size_t used = 0;

        if (rem == 10 || rem == 14) {
            user_id = std::to_string(read_u16(p));
            status = p[2];
            punch = p[3];
            timehex = p + 4;
            used = rem;
        } else if (rem == 12) {
            user_id = std::to_string(read_u32(p));
            status = p[4];
            punch = p[5];
            timehex = p + 6;
            used = 12;
        } else if (rem == 32 || rem == 36 || rem == 37 || rem >= 52) {
            user_id = decode_text(p, 24);
            status = p[24];
            punch = p[25];
            timehex = p + 26;
            used = rem >= 52 ? 52 : rem;
        } else {
            break;
        }

        const auto* user = find_by_user_id(users, user_id);
        json uid = user ? user->uid : json(user_id);
        out.push_back(make_event(uid, user_id, decode_time_hex(timehex), status, punch));
        pos += used;
    }
    return out;
}

Bytes pack_user(const UserRecord& user, std::size_t record_size) {
    require_device_uid(user.uid);
    const uint8_t privilege = user.privilege == Privilege::Admin ? kAdminPrivilegeLevel : 0;
    Bytes out;
    if (record_size == 28) {
        append_u16(out, static_cast<uint16_t>(user.uid));
        out.push_back(privilege);
        append_fixed(out, user.password, 5);
        append_fixed(out, user.name, 8);
        append_u32(out, static_cast<uint32_t>(user.card));
        out.push_back(0);
        out.push_back(static_cast<uint8_t>(RecordNormalizer::coerce_int(json(user.group_id))));
        append_u16(out, 0);
        append_u32(out, static_cast<uint32_t>(RecordNormalizer::coerce_int(json(user.user_id))));
        return out;
    }
    append_u16(out, static_cast<uint16_t>(user.uid));
    out.push_back(privilege);
    append_fixed(out, user.password, 8);
    append_fixed(out, user.name, 24);
    append_u32(out, static_cast<uint32_t>(user.card));
    out.push_back(0);
    append_fixed(out, user.group_id, 7);
    out.push_back(0);
    append_fixed(out, user.user_id, 24);
    return out;
}

Bytes pack_read_buffer_request(uint16_t command, uint32_t fct, uint32_t ext) {
    Bytes out;
    out.push_back(1);
    append_u16(out, command);
    append_u32(out, fct);
    append_u32(out, ext);
    return out;
}

} // namespace punchsync::zk
