#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Records.hpp"

namespace punchsync {

// Record lacks a mandatory field; dropped before the store.
struct SkippedRecord {
    std::string reason;
};

// Record could not be interpreted at all.
struct ErroredRecord {
    std::string detail;
};

using AttendanceOutcome = std::variant<AttendanceEvent, SkippedRecord, ErroredRecord>;

struct AttendanceBatch {
    std::vector<AttendanceEvent> events;
    int64_t skipped = 0;
    int64_t errored = 0;
};

class RecordNormalizer {
public:
    // Detailed log lines per batch; later errors are only counted.
    static constexpr int kVerboseErrorLimit = 3;

    static AttendanceOutcome normalize_attendance(const AttendanceEventRaw& raw);
    static UserRecord normalize_user(const UserRecordRaw& raw);

    // `context` names the source device in log lines.
    static AttendanceBatch normalize_attendance_batch(const std::vector<AttendanceEventRaw>& raws,
                                                      const std::string& context = {});
    static std::vector<UserRecord> normalize_users(const std::vector<UserRecordRaw>& raws);

    // Integer coercion: integers pass, finite floats truncate, booleans map to 0/1,
    // strings must hold a complete base-10 integer after trimming. Anything else is `fallback`.
    static int64_t coerce_int(const nlohmann::json& value, int64_t fallback = 0);

    // Text coercion: null is absent, strings are trimmed, numbers and booleans render
    // as text. Throws std::invalid_argument for objects, arrays and binary values.
    static std::optional<std::string> coerce_text(const nlohmann::json& value);

    static std::string trim(const std::string& s);

    // Seconds since 1970-01-01 00:00:00 for a "YYYY-MM-DD HH:MM:SS" wall clock
    // read as UTC; nullopt when the text is not such a timestamp.
    static std::optional<int64_t> timestamp_seconds(const std::string& timestamp);
};

} // namespace punchsync
