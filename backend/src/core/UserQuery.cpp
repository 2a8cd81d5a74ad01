#include "core/UserQuery.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace punchsync {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool UserQuery::matches(const UserRecord& user) const {
    switch (field) {
        case Field::UserId: return user.user_id == text;
        case Field::Name: return lowercase(user.name).find(lowercase(text)) != std::string::npos;
        case Field::Admins: return user.privilege == Privilege::Admin;
    }
    return false;
}

std::string UserQuery::describe() const {
    switch (field) {
        case Field::UserId: return "user_id = " + text;
        case Field::Name: return "name containing '" + text + "'";
        case Field::Admins: return "admin accounts";
    }
    return {};
}

std::vector<UserRecord> filter_users(const std::vector<UserRecord>& users, const UserQuery& query) {
    std::vector<UserRecord> out;
    std::copy_if(users.begin(), users.end(), std::back_inserter(out),
                 [&](const UserRecord& u) { return query.matches(u); });
    return out;
}

} // namespace punchsync
