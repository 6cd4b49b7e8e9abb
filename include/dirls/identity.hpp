#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace dirls {

class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    [[nodiscard]] virtual std::optional<std::string> user_name(std::uint32_t uid) const = 0;
    [[nodiscard]] virtual std::optional<std::string> group_name(std::uint32_t gid) const = 0;
};

// Backed by the passwd and group databases. Lookups are cached per instance.
class SystemIdentityResolver final : public IdentityResolver {
public:
    [[nodiscard]] std::optional<std::string> user_name(std::uint32_t uid) const override;
    [[nodiscard]] std::optional<std::string> group_name(std::uint32_t gid) const override;

private:
    mutable std::unordered_map<std::uint32_t, std::optional<std::string>> users_;
    mutable std::unordered_map<std::uint32_t, std::optional<std::string>> groups_;
};

} // namespace dirls
