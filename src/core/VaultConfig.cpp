#include "notevault/core/VaultConfig.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include "notevault/storage/StorageErrors.hpp"
#include <algorithm>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace notevault::core
{
namespace
{

constexpr std::array<std::uint8_t, 8> g_kMetaMagic{ 'N', 'V', 'L', 'T', 'M', 'E', 'T', 'A' };
constexpr std::uint32_t g_kMetaVersion{ 1U };
constexpr std::uint32_t g_kMaxFieldBytes{ 4096U };
constexpr std::string_view g_kTempSuffix{ ".tmp" };

using notevault::storage::ConfigIOError;
using notevault::storage::ConfigParseError;

[[nodiscard]] std::filesystem::path metaPathFor(const std::filesystem::path& dir)
{
    return dir / std::filesystem::path{ g_kConfigFileName };
}

[[nodiscard]] std::filesystem::path verifierPathFor(const std::filesystem::path& dir)
{
    return dir / std::filesystem::path{ g_kVerifierFileName };
}

[[nodiscard]] bool pathExists(const std::filesystem::path& p) noexcept
{
    std::error_code ec{};
    return std::filesystem::exists(p, ec) && !ec;
}

[[nodiscard]] std::vector<std::byte> readWholeFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw ConfigIOError("config: failed to open " + path.filename().string() + " for reading");
    }
    std::vector<char> raw{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        throw ConfigIOError("config: failed to read " + path.filename().string());
    }

    std::vector<std::byte> out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(), [](char c) { return static_cast<std::byte>(c); });
    return out;
}

void writeFileAtomically(const std::filesystem::path& path, std::span<const std::byte> bytes)
{
    std::filesystem::path tmpPath{ path };
    tmpPath += g_kTempSuffix;
    {
        std::ofstream out{ tmpPath, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            throw ConfigIOError("config: failed to open " + tmpPath.filename().string() + " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            std::error_code ignored{};
            std::filesystem::remove(tmpPath, ignored);
            throw ConfigIOError("config: failed to write " + tmpPath.filename().string());
        }
    }

    std::error_code ec{};
    std::filesystem::rename(tmpPath, path, ec);
    if (ec)
    {
        std::error_code ignored{};
        std::filesystem::remove(tmpPath, ignored);
        throw ConfigIOError("config: failed to replace " + path.filename().string() + ": " + ec.message());
    }
}

class MetaReader final
{
public:
    explicit MetaReader(std::span<const std::byte> bytes) noexcept : m_bytes(bytes)
    {
    }

    [[nodiscard]] std::span<const std::byte> take(std::size_t n)
    {
        if (n > m_bytes.size() - m_offset)
        {
            throw ConfigParseError("config: truncated metadata file");
        }
        const auto out{ m_bytes.subspan(m_offset, n) };
        m_offset += n;
        return out;
    }

    // Little-endian.
    [[nodiscard]] std::uint32_t u32()
    {
        const auto raw{ take(sizeof(std::uint32_t)) };
        std::uint32_t v{ 0U };
        for (std::size_t i{ raw.size() }; i > 0U; --i)
        {
            v = (v << 8U) | std::to_integer<std::uint32_t>(raw[i - 1U]);
        }
        return v;
    }

    [[nodiscard]] std::string lengthPrefixed()
    {
        const std::uint32_t len{ u32() };
        if (len > g_kMaxFieldBytes)
        {
            throw ConfigParseError("config: field length out of range");
        }
        const auto raw{ take(len) };
        return std::string{ reinterpret_cast<const char*>(raw.data()), raw.size() };
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return m_offset == m_bytes.size();
    }

private:
    std::span<const std::byte> m_bytes;
    std::size_t m_offset{ 0U };
};

class MetaWriter final
{
public:
    void bytes(std::span<const std::uint8_t> raw)
    {
        for (const std::uint8_t b : raw)
        {
            m_out.push_back(static_cast<std::byte>(b));
        }
    }

    // Little-endian.
    void u32(std::uint32_t v)
    {
        for (std::size_t i{}; i < sizeof(v); ++i)
        {
            m_out.push_back(static_cast<std::byte>(v & 0xFFU));
            v >>= 8U;
        }
    }

    void lengthPrefixed(std::string_view s)
    {
        if (s.size() > g_kMaxFieldBytes)
        {
            throw ConfigIOError("config: field too long to persist");
        }
        u32(static_cast<std::uint32_t>(s.size()));
        for (const char c : s)
        {
            m_out.push_back(static_cast<std::byte>(c));
        }
    }

    [[nodiscard]] std::vector<std::byte> finish() noexcept
    {
        return std::move(m_out);
    }

private:
    std::vector<std::byte> m_out{};
};

[[nodiscard]] std::vector<std::byte> encodeMeta(const std::filesystem::path& storagePath, std::string_view salt)
{
    MetaWriter writer{};
    writer.bytes(g_kMetaMagic);
    writer.u32(g_kMetaVersion);
    writer.lengthPrefixed(storagePath.string());
    writer.lengthPrefixed(salt);
    return writer.finish();
}

struct DecodedMeta final
{
    std::filesystem::path storagePath;
    std::string salt;
};

[[nodiscard]] DecodedMeta decodeMeta(std::span<const std::byte> bytes)
{
    MetaReader reader{ bytes };

    const auto magic{ reader.take(g_kMetaMagic.size()) };
    if (!std::equal(magic.begin(), magic.end(), g_kMetaMagic.begin(),
                    [](std::byte a, std::uint8_t b) { return std::to_integer<std::uint8_t>(a) == b; }))
    {
        throw ConfigParseError("config: invalid metadata magic");
    }
    if (reader.u32() != g_kMetaVersion)
    {
        throw ConfigParseError("config: unsupported metadata version");
    }

    DecodedMeta meta{};
    meta.storagePath = std::filesystem::path{ reader.lengthPrefixed() };
    meta.salt = reader.lengthPrefixed();
    if (meta.salt.empty())
    {
        throw ConfigParseError("config: empty password salt");
    }
    if (!reader.atEnd())
    {
        throw ConfigParseError("config: trailing bytes in metadata file");
    }
    return meta;
}

[[nodiscard]] PasswordVerifier decodeVerifier(std::span<const std::byte> bytes)
{
    PasswordVerifier out{};
    if (bytes.size() != out.size())
    {
        throw ConfigParseError("config: verifier has wrong length");
    }
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](std::byte b) { return std::to_integer<std::uint8_t>(b); });
    return out;
}

} // namespace

VaultConfig::VaultConfig(std::filesystem::path storageDir, std::string salt, std::optional<PasswordVerifier> verifier)
    : m_storagePath(std::move(storageDir)), m_passwordSalt(std::move(salt)), m_verifier(verifier)
{
}

bool VaultConfig::exists(const std::filesystem::path& storageDir) noexcept
{
    return pathExists(metaPathFor(storageDir)) || pathExists(verifierPathFor(storageDir));
}

VaultResult<VaultConfig> VaultConfig::load(const std::filesystem::path& storageDir) noexcept
{
    auto log{ notevault::logging::LogRegistry::config() };
    try
    {
        const auto metaPath{ metaPathFor(storageDir) };
        const auto verifierPath{ verifierPathFor(storageDir) };
        const bool hasMeta{ pathExists(metaPath) };
        const bool hasVerifier{ pathExists(verifierPath) };
        if (!hasMeta || !hasVerifier)
        {
            throw ConfigParseError(hasMeta ? "config: verifier file missing" : "config: metadata file missing");
        }

        auto meta{ decodeMeta(readWholeFile(metaPath)) };
        const auto verifier{ decodeVerifier(readWholeFile(verifierPath)) };

        // The directory the files were found in is authoritative; a vault may have been moved.
        if (meta.storagePath != storageDir)
        {
            log->debug("config: stored path {} differs from {}, using the latter", meta.storagePath.string(),
                       storageDir.string());
        }

        log->debug("config: loaded vault configuration from {}", storageDir.string());
        return VaultConfig{ storageDir, std::move(meta.salt), verifier };
    }
    catch (const ConfigParseError& e)
    {
        log->error("{}", e.what());
        return VaultError::ConfigParse;
    }
    catch (const ConfigIOError& e)
    {
        log->error("{}", e.what());
        return VaultError::ConfigIO;
    }
    catch (const std::exception& e)
    {
        log->error("config: load failed: {}", e.what());
        return VaultError::ConfigIO;
    }
}

VaultConfig VaultConfig::initialize(std::filesystem::path storageDir, std::string salt)
{
    if (salt.empty())
    {
        throw std::invalid_argument("VaultConfig::initialize: empty salt");
    }
    return VaultConfig{ std::move(storageDir), std::move(salt), std::nullopt };
}

std::span<const std::uint8_t> VaultConfig::verifier() const noexcept
{
    if (!m_verifier)
    {
        return {};
    }
    return std::span<const std::uint8_t>{ *m_verifier };
}

void VaultConfig::setVerifier(std::span<const std::uint8_t> verifier)
{
    PasswordVerifier copy{};
    if (verifier.size() != copy.size())
    {
        throw std::invalid_argument("VaultConfig::setVerifier: wrong verifier length");
    }
    std::copy(verifier.begin(), verifier.end(), copy.begin());
    m_verifier = copy;
}

VaultResult<std::monostate> VaultConfig::save() const noexcept
{
    auto log{ notevault::logging::LogRegistry::config() };
    if (!m_verifier)
    {
        log->error("config: refusing to save a vault without a password verifier");
        return VaultError::ConfigIO;
    }

    try
    {
        const auto metaBytes{ encodeMeta(m_storagePath, m_passwordSalt) };
        const auto verifierBytes{ std::as_bytes(std::span<const std::uint8_t>{ *m_verifier }) };

        const auto metaPath{ metaPathFor(m_storagePath) };
        const bool firstSave{ !pathExists(verifierPathFor(m_storagePath)) };

        // The verifier rename is the commit point. Until it lands the previous verifier stays on disk.
        writeFileAtomically(metaPath, std::span<const std::byte>{ metaBytes });
        try
        {
            writeFileAtomically(verifierPathFor(m_storagePath), verifierBytes);
        }
        catch (const ConfigIOError&)
        {
            if (firstSave)
            {
                std::error_code ec{};
                std::filesystem::remove(metaPath, ec);
                if (ec)
                {
                    log->error("config: failed to remove orphaned {}: {}", metaPath.filename().string(),
                               ec.message());
                }
            }
            throw;
        }
    }
    catch (const std::exception& e)
    {
        log->error("{}", e.what());
        return VaultError::ConfigIO;
    }

    log->debug("config: saved vault configuration to {}", m_storagePath.string());
    return std::monostate{};
}

VaultResult<std::monostate> VaultConfig::erase() noexcept
{
    auto log{ notevault::logging::LogRegistry::config() };
    std::error_code metaEc{};
    std::error_code verifierEc{};
    std::filesystem::remove(verifierPathFor(m_storagePath), verifierEc);
    std::filesystem::remove(metaPathFor(m_storagePath), metaEc);

    if (metaEc || verifierEc)
    {
        log->error("config: failed to erase configuration in {}: {}", m_storagePath.string(),
                   (verifierEc ? verifierEc : metaEc).message());
        return VaultError::ConfigIO;
    }
    m_verifier.reset();
    log->info("config: configuration erased");
    return std::monostate{};
}

} // namespace notevault::core
