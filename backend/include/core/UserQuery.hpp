#pragma once

#include <string>
#include <vector>

#include "core/Records.hpp"

namespace punchsync {

/**
 * @brief Roster lookup: exact user_id, case-insensitive name fragment, or
 * every administrator.
 */
struct UserQuery {
    enum class Field { UserId, Name, Admins };

    Field field = Field::Admins;
    std::string text;

    static UserQuery by_user_id(std::string user_id) { return {Field::UserId, std::move(user_id)}; }
    static UserQuery by_name(std::string fragment) { return {Field::Name, std::move(fragment)}; }
    static UserQuery admins() { return {Field::Admins, {}}; }

    bool matches(const UserRecord& user) const;
    std::string describe() const;
};

// Matching users in roster order.
std::vector<UserRecord> filter_users(const std::vector<UserRecord>& users, const UserQuery& query);

} // namespace punchsync
