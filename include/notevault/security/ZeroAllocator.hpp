#ifndef INCLUDE_NOTEVAULT_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_NOTEVAULT_SECURITY_ZEROALLOCATOR_HPP

#include "notevault/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace notevault::security
{

// std::allocator that zeroes every block before giving it back, so reallocation and destruction of a
// SecureBuffer or SecureString leave no key bytes or note text behind on the heap.
template <class T> class ZeroAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "ZeroAllocator holds raw bytes only");

public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;

    ZeroAllocator() noexcept = default;
    template <class U> constexpr ZeroAllocator(const ZeroAllocator<U>& /*other*/) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<T>{ p, n });
        std::allocator<T>{}.deallocate(p, n);
    }

    template <class U> [[nodiscard]] constexpr bool operator==(const ZeroAllocator<U>& /*other*/) const noexcept
    {
        return true;
    }
};

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_ZEROALLOCATOR_HPP
