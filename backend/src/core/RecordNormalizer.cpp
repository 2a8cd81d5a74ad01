#include "core/RecordNormalizer.hpp"
#include "core/ErrorCatalog.hpp"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace punchsync {

static int narrow_to_int(int64_t v) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return 0;
    return static_cast<int>(v);
}

// Never fails: structured values are kept as their JSON text.
static std::string lenient_text(const json& value) {
    if (value.is_null()) return {};
    if (value.is_string()) return value.get<std::string>();
    if (value.is_object() || value.is_array() || value.is_binary()) return value.dump();
    auto text = RecordNormalizer::coerce_text(value);
    return text ? *text : std::string();
}

std::string RecordNormalizer::trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<int64_t> RecordNormalizer::timestamp_seconds(const std::string& timestamp) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, consumed = 0;
    if (std::sscanf(timestamp.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        static_cast<std::size_t>(consumed) != timestamp.size()) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 ||
        minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }
    // Civil date to day number, March-based year.
    const int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = era * 146097 + doe - 719468;
    return days * 86400 + hour * 3600 + minute * 60 + second;
}

int64_t RecordNormalizer::coerce_int(const json& value, int64_t fallback) {
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return fallback;
        return static_cast<int64_t>(u);
    }
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d)) return fallback;
        d = std::trunc(d);
        if (d < -9.2e18 || d > 9.2e18) return fallback;
        return static_cast<int64_t>(d);
    }
    if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
    if (value.is_string()) {
        auto text = trim(value.get<std::string>());
        if (text.empty()) return fallback;
        try {
            std::size_t pos = 0;
            long long parsed = std::stoll(text, &pos, 10);
            if (pos != text.size()) return fallback;
            return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::optional<std::string> RecordNormalizer::coerce_text(const json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return trim(value.get<std::string>());
    if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    if (value.is_number_float() || value.is_boolean()) return value.dump();
    throw std::invalid_argument(errors::D3400_FIELD_NOT_TEXT);
}

AttendanceOutcome RecordNormalizer::normalize_attendance(const AttendanceEventRaw& raw) {
    try {
        auto user_id = coerce_text(raw.user_id);
        auto timestamp = coerce_text(raw.timestamp);
        if (!user_id) return SkippedRecord{"missing user_id"};
        if (!timestamp || timestamp->empty()) return SkippedRecord{"missing timestamp"};
        if (user_id->empty()) return SkippedRecord{"empty user_id"};

        AttendanceEvent ev;
        ev.uid = coerce_int(raw.uid);
        ev.user_id = *user_id;
        ev.timestamp = *timestamp;
        ev.status = narrow_to_int(coerce_int(raw.status));
        ev.punch = narrow_to_int(coerce_int(raw.punch));
        return ev;
    } catch (const std::exception& e) {
        return ErroredRecord{e.what()};
    }
}

UserRecord RecordNormalizer::normalize_user(const UserRecordRaw& raw) {
    UserRecord u;
    u.uid = coerce_int(raw.uid);
    u.user_id = trim(lenient_text(raw.user_id));
    u.name = lenient_text(raw.name);
    u.privilege = coerce_int(raw.privilege) >= kAdminPrivilegeLevel ? Privilege::Admin : Privilege::Default;
    u.password = lenient_text(raw.password);
    u.group_id = lenient_text(raw.group_id);
    u.card = coerce_int(raw.card);
    return u;
}

AttendanceBatch RecordNormalizer::normalize_attendance_batch(const std::vector<AttendanceEventRaw>& raws,
                                                             const std::string& context) {
    AttendanceBatch batch;
    batch.events.reserve(raws.size());
    for (std::size_t i = 0; i < raws.size(); ++i) {
        auto outcome = normalize_attendance(raws[i]);
        if (auto* ev = std::get_if<AttendanceEvent>(&outcome)) {
            batch.events.push_back(std::move(*ev));
        } else if (std::holds_alternative<SkippedRecord>(outcome)) {
            ++batch.skipped;
        } else {
            ++batch.errored;
            if (batch.errored <= kVerboseErrorLimit) {
                std::cerr << "RecordNormalizer: " << (context.empty() ? "" : context + ": ")
                          << "record " << i << " rejected: " << std::get<ErroredRecord>(outcome).detail
                          << std::endl;
            }
        }
    }
    if (batch.errored > kVerboseErrorLimit) {
        std::cerr << "RecordNormalizer: " << (context.empty() ? "" : context + ": ")
                  << (batch.errored - kVerboseErrorLimit) << " more record errors suppressed" << std::endl;
    }
    return batch;
}

std::vector<UserRecord> RecordNormalizer::normalize_users(const std::vector<UserRecordRaw>& raws) {
    std::vector<UserRecord> out;
    out.reserve(raws.size());
    for (const auto& r : raws) out.push_back(normalize_user(r));
    return out;
}

} // namespace punchsync
