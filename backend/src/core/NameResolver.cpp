#include "core/NameResolver.hpp"

namespace punchsync {

NameResolver NameResolver::build(const std::vector<UserRecord>& users) {
    NameResolver index;
    for (const auto& u : users) index.insert(u);
    return index;
}

void NameResolver::insert(const UserRecord& user) {
    names_[std::to_string(user.uid)] = user.name;
    if (!user.user_id.empty()) names_[user.user_id] = user.name;
}

std::string NameResolver::resolve(int64_t uid, const std::string& user_id) const {
    auto it = names_.find(std::to_string(uid));
    if (it != names_.end() && !it->second.empty()) return it->second;
    if (!user_id.empty()) {
        it = names_.find(user_id);
        if (it != names_.end()) return it->second;
    }
    return {};
}

} // namespace punchsync
