#ifndef INCLUDE_NOTEVAULT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_NOTEVAULT_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace notevault::crypto
{

constexpr std::size_t g_kCredentialBytes{ 32 };

struct ScryptParams final
{
    std::uint64_t costN;
    std::uint32_t blockSizeR;
    std::uint32_t parallelismP;
};

// Fixed for every vault. Changing them orphans existing verifiers.
constexpr ScryptParams g_kScryptVaultParams{ .costN = 1ULL << 14U, .blockSizeR = 8U, .parallelismP = 1U };

} // namespace notevault::crypto

#endif // INCLUDE_NOTEVAULT_CRYPTO_KDFPARAMS_HPP
