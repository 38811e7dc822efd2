#ifndef INCLUDE_NOTEVAULT_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_NOTEVAULT_SECURITY_SECUREBUFFER_HPP

#include "notevault/security/MemoryWiper.hpp"
#include "notevault/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace notevault::security
{

template <typename T> using ZeroedVector = std::vector<T, ZeroAllocator<T>>;

// Key material: credentials, subkeys, decrypted AEAD output.
using SecureBuffer = ZeroedVector<std::uint8_t>;

template <typename T> [[nodiscard]] std::span<std::byte> asWritableBytes(ZeroedVector<T>& v) noexcept
{
    return std::as_writable_bytes(std::span{ v });
}

template <typename T> [[nodiscard]] std::span<const std::byte> asBytes(const ZeroedVector<T>& v) noexcept
{
    return std::as_bytes(std::span{ v });
}

// Wipes the contents now and gives the storage back, instead of waiting for the destructor.
template <typename T> void secureRelease(ZeroedVector<T>& v) noexcept
{
    secureWipe(asWritableBytes(v));
    ZeroedVector<T>{}.swap(v);
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_SECUREBUFFER_HPP
