#ifndef INCLUDE_NOTEVAULT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_NOTEVAULT_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace notevault::security
{

// Runs in time that depends only on the lengths, which are not secret (verifiers are fixed-size).
[[nodiscard]] bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept;

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_SECUREEQUALS_HPP
