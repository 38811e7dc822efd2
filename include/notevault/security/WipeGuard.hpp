#ifndef INCLUDE_NOTEVAULT_SECURITY_WIPEGUARD_HPP
#define INCLUDE_NOTEVAULT_SECURITY_WIPEGUARD_HPP

#include "notevault/security/MemoryWiper.hpp"
#include <array>
#include <cstddef>
#include <span>
#include <type_traits>

namespace notevault::security
{

// Wipes every registered buffer when the scope ends, e.g. all passwords typed into one dialog.
// Each region is captured at construction: do not resize a guarded container afterwards.
class [[nodiscard]] WipeGuard final
{
public:
    static constexpr std::size_t kMaxRegions{ 4U };

    template <typename First, typename... Rest>
    explicit WipeGuard(First& first, Rest&... rest) noexcept
        : m_regions{ regionOf(first), regionOf(rest)... }, m_count{ 1U + sizeof...(Rest) }
    {
        static_assert(1U + sizeof...(Rest) <= kMaxRegions, "WipeGuard: too many regions");
    }

    WipeGuard(const WipeGuard&) = delete;
    WipeGuard& operator=(const WipeGuard&) = delete;
    WipeGuard(WipeGuard&&) = delete;
    WipeGuard& operator=(WipeGuard&&) = delete;

    ~WipeGuard() noexcept
    {
        for (std::size_t i{}; i < m_count; ++i)
        {
            secureWipe(m_regions[i]);
        }
    }

    // Keeps the contents, e.g. when a buffer is handed on to an owner that wipes it itself.
    void dismiss() noexcept
    {
        m_count = 0U;
    }

private:
    template <typename Container> [[nodiscard]] static std::span<std::byte> regionOf(Container& c) noexcept
    {
        static_assert(std::is_trivially_copyable_v<typename Container::value_type>);
        return std::as_writable_bytes(std::span{ c.data(), c.size() });
    }

    std::array<std::span<std::byte>, kMaxRegions> m_regions{};
    std::size_t m_count{ 0U };
};

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_WIPEGUARD_HPP
