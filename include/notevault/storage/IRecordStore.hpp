#ifndef INCLUDE_NOTEVAULT_STORAGE_IRECORDSTORE_HPP
#define INCLUDE_NOTEVAULT_STORAGE_IRECORDSTORE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notevault::storage
{

// Body is the stored (encrypted) token; the store never sees plaintext.
struct StoredRecord final
{
    std::string title{};
    std::string body{};
};

// Persistent title -> body mapping with unique titles.
//
// Failures of the backing store throw StorageIOError. Any call after close() throws std::logic_error.
class IRecordStore
{
public:
    IRecordStore() = default;
    IRecordStore(const IRecordStore&) = delete;
    IRecordStore& operator=(const IRecordStore&) = delete;
    IRecordStore(IRecordStore&&) = delete;
    IRecordStore& operator=(IRecordStore&&) = delete;
    virtual ~IRecordStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view title) const = 0;

    // Throws DuplicateTitleError if `title` already exists; never overwrites.
    virtual void put(std::string_view title, std::string_view body) = 0;

    // No-op when absent.
    virtual void remove(std::string_view title) = 0;

    // Sorted ascending.
    [[nodiscard]] virtual std::vector<std::string> listTitles() const = 0;
    [[nodiscard]] virtual std::vector<StoredRecord> listRecords() const = 0;

    // Rewrites the body of every listed title in one transaction; all or nothing.
    virtual void replaceBodies(const std::vector<StoredRecord>& records) = 0;

    // Deletes every record and compacts the file.
    virtual void clear() = 0;

    virtual void close() noexcept = 0;
};

} // namespace notevault::storage

#endif // INCLUDE_NOTEVAULT_STORAGE_IRECORDSTORE_HPP
