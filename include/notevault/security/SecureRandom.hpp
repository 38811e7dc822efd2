#ifndef INCLUDE_NOTEVAULT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_NOTEVAULT_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace notevault::security
{

// Fills `out` from the OS CSPRNG. Returns false if the kernel source fails; `out` is then unspecified.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace notevault::security

#endif // INCLUDE_NOTEVAULT_SECURITY_SECURERANDOM_HPP
