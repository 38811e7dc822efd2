#include "notevault/security/SecureEquals.hpp"

namespace notevault::security
{

bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    // Out of line and volatile so the loop cannot be turned into an early-exit memcmp.
    volatile std::byte acc{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        acc = acc | (a[i] ^ b[i]);
    }
    return acc == std::byte{ 0 };
}

} // namespace notevault::security
