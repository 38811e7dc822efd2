#ifndef INCLUDE_NOTEVAULT_SECURITY_SECURESTRING_HPP
#define INCLUDE_NOTEVAULT_SECURITY_SECURESTRING_HPP

#include "notevault/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace notevault::security
{

// Passwords and decrypted note bodies. Not NUL-terminated.
using SecureString = ZeroedVector<char>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::span<const std::uint8_t> bytes)
{
    SecureString out(bytes.size());
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        out[i] = static_cast<char>(bytes[i]);
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_SECURESTRING_HPP
