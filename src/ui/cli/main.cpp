#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "notevault/core/AccessStateMachine.hpp"
#include "notevault/core/CredentialManager.hpp"
#include "notevault/core/VaultConfig.hpp"
#include "notevault/crypto/providers/OpenSslProviderFactory.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include "notevault/storage/sqlite/SqliteRecordStoreFactory.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace
{

constexpr std::int64_t g_kDefaultIdleTimeoutSeconds{ 300 };
constexpr int g_kExitFailure{ 1 };

// $HOME/.config/NoteVault, created when missing.
[[nodiscard]] std::optional<std::filesystem::path> defaultStorageDir()
{
    const char* home{ std::getenv("HOME") };
    if (home == nullptr || *home == '\0')
    {
        return std::nullopt;
    }

    const std::filesystem::path dir{ std::filesystem::path{ home } / ".config" / "NoteVault" };
    std::error_code ec{};
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec))
    {
        return std::nullopt;
    }
    return dir;
}

[[nodiscard]] notevault::core::VaultResult<notevault::core::VaultConfig>
openOrInitializeConfig(const std::filesystem::path& dir, notevault::crypto::ICryptoProvider& crypto)
{
    if (notevault::core::VaultConfig::exists(dir))
    {
        return notevault::core::VaultConfig::load(dir);
    }

    notevault::core::CredentialManager credentials{ crypto };
    auto salt{ credentials.generateSalt() };
    if (const auto* err{ std::get_if<notevault::core::VaultError>(&salt) })
    {
        return *err;
    }
    notevault::logging::LogRegistry::config()->info("config: no vault in {}, starting a new one", dir.string());
    return notevault::core::VaultConfig::initialize(dir, std::move(std::get<std::string>(salt)));
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "NoteVault: password protected local notes" };

    std::string storageDirArg{};
    int verbosity{ 0 };
    std::int64_t idleTimeoutSeconds{ g_kDefaultIdleTimeoutSeconds };

    app.add_option("-d,--storage-dir", storageDirArg,
                   "Alternative directory for application data. Must be an existing directory.")
        ->check(CLI::ExistingDirectory);
    app.add_flag("-v,--verbose", verbosity, "Verbosity: -v for debug, -vv for trace logging.");
    app.add_option("--idle-timeout", idleTimeoutSeconds, "Seconds of inactivity before logoff (0 disables).")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    notevault::logging::LogRegistry::init(notevault::logging::LogRegistry::levelForVerbosity(verbosity));
    auto log{ notevault::logging::LogRegistry::notevault() };

    if (!notevault::ui::cli::lockProcessMemory())
    {
        log->warn("could not lock process memory or disable core dumps");
    }

    try
    {
        std::filesystem::path storageDir{};
        if (!storageDirArg.empty())
        {
            storageDir = std::filesystem::path{ storageDirArg };
        }
        else if (auto dir{ defaultStorageDir() })
        {
            storageDir = std::move(*dir);
        }
        else
        {
            std::cerr << "fatal: cannot resolve the default storage directory, use --storage-dir\n";
            return g_kExitFailure;
        }
        log->debug("using storage directory {}", storageDir.string());

        auto crypto{ notevault::crypto::providers::makeOpenSslCryptoProvider() };

        auto config{ openOrInitializeConfig(storageDir, *crypto) };
        if (const auto* err{ std::get_if<notevault::core::VaultError>(&config) })
        {
            std::cerr << "fatal: " << notevault::core::toString(*err) << " (" << storageDir.string() << ")\n";
            return g_kExitFailure;
        }

        auto records{ notevault::storage::sqlite::makeSqliteRecordStore(storageDir) };

        int rc{ 0 };
        {
            notevault::core::AccessStateMachine machine{ *crypto, *records,
                                                         std::move(std::get<notevault::core::VaultConfig>(config)),
                                                         std::chrono::seconds{ idleTimeoutSeconds } };
            notevault::ui::cli::InteractiveShell shell{ machine, std::cin, std::cout, notevault::ui::cli::readPassword,
                                                        notevault::ui::cli::readLine };
            rc = shell.run();
        }
        records->close();
        return rc;
    }
    catch (const std::exception& e)
    {
        log->critical("{}", e.what());
        std::cerr << "fatal: " << e.what() << '\n';
        return g_kExitFailure;
    }
}
