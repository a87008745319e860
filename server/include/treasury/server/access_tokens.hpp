#pragma once

#include <optional>
#include <string>
#include <vector>

#include "treasury/server/config.hpp"

namespace treasury::server
{

    class AccessTokens
    {
    public:
        explicit AccessTokens(std::vector<AccessTokenEntry> entries);

        // Every configured token is compared, in constant time, on each call.
        std::optional<UserId> authorize(const std::string &token) const;

        std::size_t size() const noexcept { return entries_.size(); }

    private:
        std::vector<AccessTokenEntry> entries_;
    };

} // namespace treasury::server
