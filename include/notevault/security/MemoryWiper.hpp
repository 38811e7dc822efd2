#ifndef INCLUDE_NOTEVAULT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_NOTEVAULT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace notevault::security
{

// Zeroes `bytes` in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> region) noexcept
{
    secureWipe(std::as_writable_bytes(region));
}

// Zeroes the characters of a std::string that carried a secret, then empties it.
void secureWipe(std::string& text) noexcept;

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_MEMORYWIPER_HPP
