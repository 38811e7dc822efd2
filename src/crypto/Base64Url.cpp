#include "notevault/crypto/Base64Url.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace notevault::crypto
{
namespace
{

// EVP_EncodeBlock works in 3-byte groups; keep every call well inside int.
constexpr std::size_t g_kMaxInputBytes{ static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3) };

[[nodiscard]] bool isUrlSafeChar(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

[[nodiscard]] char toStandardAlphabet(char c) noexcept
{
    if (c == '-')
    {
        return '+';
    }
    return c == '_' ? '/' : c;
}

[[nodiscard]] char toUrlAlphabet(char c) noexcept
{
    if (c == '+')
    {
        return '-';
    }
    return c == '/' ? '_' : c;
}

} // namespace

std::string base64UrlEncode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > g_kMaxInputBytes)
    {
        throw std::length_error("base64UrlEncode: input too large");
    }

    // Padded length plus the terminating NUL that EVP_EncodeBlock writes.
    std::string out(((bytes.size() + 2U) / 3U) * 4U + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    out.resize(static_cast<std::size_t>(written));

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    std::transform(out.begin(), out.end(), out.begin(), toUrlAlphabet);
    return out;
}

std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if ((text.size() % 4U) == 1U || text.size() > g_kMaxInputBytes)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock would accept '+', '/', '=' and surrounding whitespace.
    if (!std::all_of(text.begin(), text.end(), isUrlSafeChar))
    {
        return std::nullopt;
    }

    const std::size_t padding{ (4U - (text.size() % 4U)) % 4U };
    std::string standard(text.size() + padding, '=');
    std::transform(text.begin(), text.end(), standard.begin(), toStandardAlphabet);

    std::vector<std::uint8_t> out((standard.size() / 4U) * 3U);
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                       static_cast<int>(standard.size())) };
    if (decoded < 0)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding.
    out.resize(static_cast<std::size_t>(decoded) - padding);

    // Non-zero trailing bits decode fine but do not re-encode to the same text.
    if (base64UrlEncode(out) != text)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace notevault::crypto
