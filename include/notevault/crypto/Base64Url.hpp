#ifndef INCLUDE_NOTEVAULT_CRYPTO_BASE64URL_HPP
#define INCLUDE_NOTEVAULT_CRYPTO_BASE64URL_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notevault::crypto
{

// RFC 4648 section 5 alphabet, no padding.
[[nodiscard]] std::string base64UrlEncode(std::span<const std::uint8_t> bytes);

// Strict: rejects padding, foreign characters, impossible lengths and non-zero trailing bits,
// so every byte sequence has exactly one accepted encoding.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text);

} // namespace notevault::crypto

#endif // INCLUDE_NOTEVAULT_CRYPTO_BASE64URL_HPP
