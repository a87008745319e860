/**
 * Treasury - Random handles and comparisons built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace treasury::crypto
{

    void ensure_sodium_init();

    // Unguessable [a-zA-Z0-9] string of `length` characters.
    std::string generate_handle(std::size_t length);

    bool constant_time_equals(std::string_view lhs, std::string_view rhs);

} // namespace treasury::crypto
