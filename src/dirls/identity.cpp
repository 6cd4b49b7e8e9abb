#include "dirls/identity.hpp"

#include <grp.h>
#include <pwd.h>
#include <sys/types.h>

namespace dirls {
namespace {

std::optional<std::string> lookup_user(uid_t uid) {
    if (auto* pw = ::getpwuid(uid)) {
        return std::string{pw->pw_name};
    }
    return std::nullopt;
}

std::optional<std::string> lookup_group(gid_t gid) {
    if (auto* gr = ::getgrgid(gid)) {
        return std::string{gr->gr_name};
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> SystemIdentityResolver::user_name(std::uint32_t uid) const {
    auto it = users_.find(uid);
    if (it == users_.end()) {
        it = users_.emplace(uid, lookup_user(static_cast<uid_t>(uid))).first;
    }
    return it->second;
}

std::optional<std::string> SystemIdentityResolver::group_name(std::uint32_t gid) const {
    auto it = groups_.find(gid);
    if (it == groups_.end()) {
        it = groups_.emplace(gid, lookup_group(static_cast<gid_t>(gid))).first;
    }
    return it->second;
}

} // namespace dirls
