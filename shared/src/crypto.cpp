#include "treasury/crypto.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace treasury::crypto
{

    namespace
    {

        constexpr std::string_view kAlphanumeric =
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string generate_handle(std::size_t length)
    {
        ensure_initialized_once();
        std::string handle;
        handle.resize(length);
        for (auto &ch : handle)
        {
            ch = kAlphanumeric[randombytes_uniform(static_cast<std::uint32_t>(kAlphanumeric.size()))];
        }
        return handle;
    }

    bool constant_time_equals(std::string_view lhs, std::string_view rhs)
    {
        ensure_initialized_once();
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

} // namespace treasury::crypto
