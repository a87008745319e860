#include "treasury/server/access_tokens.hpp"

#include <spdlog/spdlog.h>

#include "treasury/crypto.hpp"

namespace treasury::server
{

    AccessTokens::AccessTokens(std::vector<AccessTokenEntry> entries)
        : entries_(std::move(entries))
    {
        crypto::ensure_sodium_init();
        if (entries_.empty())
        {
            spdlog::warn("No access tokens configured; every authentication attempt will fail");
        }
    }

    std::optional<UserId> AccessTokens::authorize(const std::string &token) const
    {
        std::optional<UserId> result;
        if (token.empty())
        {
            return result;
        }
        for (const auto &entry : entries_)
        {
            if (crypto::constant_time_equals(entry.token, token) && !result)
            {
                result = entry.user_id;
            }
        }
        return result;
    }

} // namespace treasury::server
