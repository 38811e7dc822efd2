#ifndef INCLUDE_NOTEVAULT_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP
#define INCLUDE_NOTEVAULT_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP

#include "notevault/storage/IRecordStore.hpp"
#include <filesystem>
#include <memory>
#include <string_view>

namespace notevault::storage::sqlite
{

constexpr std::string_view g_kDbFileName{ "db.sqlite" };

// Opens (creating if needed) `<storageDir>/db.sqlite` and its schema. Throws StorageIOError on failure.
[[nodiscard]] std::unique_ptr<notevault::storage::IRecordStore>
makeSqliteRecordStore(const std::filesystem::path& storageDir);

} // namespace notevault::storage::sqlite

#endif // INCLUDE_NOTEVAULT_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP
