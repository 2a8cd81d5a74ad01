#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Records.hpp"

namespace punchsync {

/**
 * @brief Name lookup keyed by both uid (as text) and user_id.
 *
 * Built once per device from its user roster. On key collisions the last
 * inserted user wins.
 */
class NameResolver {
public:
    NameResolver() = default;

    static NameResolver build(const std::vector<UserRecord>& users);

    void insert(const UserRecord& user);

    // uid key first, then user_id key; "" when neither yields a name.
    std::string resolve(int64_t uid, const std::string& user_id) const;

    std::size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

private:
    std::unordered_map<std::string, std::string> names_;
};

} // namespace punchsync
