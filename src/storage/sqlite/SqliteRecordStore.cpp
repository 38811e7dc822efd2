#include "notevault/storage/sqlite/SqliteRecordStoreFactory.hpp"

#include "notevault/logging/LogRegistry.hpp"
#include "notevault/storage/IRecordStore.hpp"
#include "notevault/storage/StorageErrors.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sqlite3.h>

namespace notevault::storage::sqlite
{
namespace
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg{ (db != nullptr) ? sqlite3_errmsg(db) : "no-db" };
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg{ nullptr };
    const int rc{ sqlite3_exec(db, sql, nullptr, nullptr, &errMsg) };
    if (rc != SQLITE_OK)
    {
        std::string msg{ sqliteErr(db, "storage: sqlite3_exec failed") };
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StorageIOError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    sqlite3* raw{ nullptr };
    const std::string filename{ path.string() };
    const int rc{ sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) };
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StorageIOError(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    (void)sqlite3_extended_result_codes(db.get(), 1);
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt{ nullptr };
    const int prepRc{ sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr) };
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw StorageIOError(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw StorageIOError(sqliteErr(db, "storage: bind text failed"));
    }
}

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text{ sqlite3_column_text(stmt, column) };
    const int bytes{ sqlite3_column_bytes(stmt, column) };
    if (text == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS records ("
             " name TEXT PRIMARY KEY,"
             " body TEXT NOT NULL"
             ");");
}

// Rolls back on scope exit unless commit() succeeded.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db) : m_db(db)
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    ~Transaction()
    {
        if (!m_committed)
        {
            (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        exec(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db;
    bool m_committed{ false };
};

class SqliteRecordStore final : public notevault::storage::IRecordStore
{
public:
    explicit SqliteRecordStore(const std::filesystem::path& dbPath) : m_db(openDb(dbPath))
    {
        ensureSchema(m_db.get());
        notevault::logging::LogRegistry::storage()->debug("storage: opened {}", dbPath.string());
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view title) const override
    {
        sqlite3* db{ requireOpen() };
        auto stmt{ prepare(db, "SELECT body FROM records WHERE name = ?;") };
        bindText(db, stmt.get(), 1, title);

        const int stepRc{ sqlite3_step(stmt.get()) };
        if (stepRc == SQLITE_ROW)
        {
            return columnText(stmt.get(), 0);
        }
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        throw StorageIOError(sqliteErr(db, "storage: select record failed"));
    }

    void put(std::string_view title, std::string_view body) override
    {
        sqlite3* db{ requireOpen() };
        auto stmt{ prepare(db, "INSERT INTO records(name, body) VALUES (?, ?);") };
        bindText(db, stmt.get(), 1, title);
        bindText(db, stmt.get(), 2, body);

        const int stepRc{ sqlite3_step(stmt.get()) };
        if (stepRc == SQLITE_CONSTRAINT_PRIMARYKEY || stepRc == SQLITE_CONSTRAINT_UNIQUE)
        {
            throw DuplicateTitleError("storage: record title already exists");
        }
        if (stepRc != SQLITE_DONE)
        {
            throw StorageIOError(sqliteErr(db, "storage: insert record failed"));
        }
    }

    void remove(std::string_view title) override
    {
        sqlite3* db{ requireOpen() };
        auto stmt{ prepare(db, "DELETE FROM records WHERE name = ?;") };
        bindText(db, stmt.get(), 1, title);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw StorageIOError(sqliteErr(db, "storage: delete record failed"));
        }
    }

    [[nodiscard]] std::vector<std::string> listTitles() const override
    {
        sqlite3* db{ requireOpen() };
        auto stmt{ prepare(db, "SELECT name FROM records ORDER BY name ASC;") };

        std::vector<std::string> out{};
        while (true)
        {
            const int stepRc{ sqlite3_step(stmt.get()) };
            if (stepRc == SQLITE_ROW)
            {
                out.push_back(columnText(stmt.get(), 0));
                continue;
            }
            if (stepRc == SQLITE_DONE)
            {
                break;
            }
            throw StorageIOError(sqliteErr(db, "storage: list titles failed"));
        }
        return out;
    }

    [[nodiscard]] std::vector<StoredRecord> listRecords() const override
    {
        sqlite3* db{ requireOpen() };
        auto stmt{ prepare(db, "SELECT name, body FROM records ORDER BY name ASC;") };

        std::vector<StoredRecord> out{};
        while (true)
        {
            const int stepRc{ sqlite3_step(stmt.get()) };
            if (stepRc == SQLITE_ROW)
            {
                out.push_back(StoredRecord{ columnText(stmt.get(), 0), columnText(stmt.get(), 1) });
                continue;
            }
            if (stepRc == SQLITE_DONE)
            {
                break;
            }
            throw StorageIOError(sqliteErr(db, "storage: list records failed"));
        }
        return out;
    }

    void replaceBodies(const std::vector<StoredRecord>& records) override
    {
        sqlite3* db{ requireOpen() };
        Transaction tx{ db };
        auto stmt{ prepare(db, "UPDATE records SET body = ? WHERE name = ?;") };
        for (const auto& record : records)
        {
            (void)sqlite3_reset(stmt.get());
            (void)sqlite3_clear_bindings(stmt.get());
            bindText(db, stmt.get(), 1, record.body);
            bindText(db, stmt.get(), 2, record.title);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            {
                throw StorageIOError(sqliteErr(db, "storage: update record failed"));
            }
            if (sqlite3_changes(db) != 1)
            {
                throw StorageIOError("storage: update target missing: " + record.title);
            }
        }
        stmt.reset();
        tx.commit();
        notevault::logging::LogRegistry::storage()->debug("storage: rewrote {} record bodies", records.size());
    }

    void clear() override
    {
        sqlite3* db{ requireOpen() };
        exec(db, "DELETE FROM records;");
        exec(db, "VACUUM;");
        notevault::logging::LogRegistry::storage()->info("storage: all records cleared");
    }

    void close() noexcept override
    {
        if (m_db)
        {
            m_db.reset();
            notevault::logging::LogRegistry::storage()->debug("storage: closed");
        }
    }

private:
    [[nodiscard]] sqlite3* requireOpen() const
    {
        if (!m_db)
        {
            throw std::logic_error("storage: record store used after close()");
        }
        return m_db.get();
    }

    SqliteDbPtr m_db;
};

} // namespace

std::unique_ptr<notevault::storage::IRecordStore> makeSqliteRecordStore(const std::filesystem::path& storageDir)
{
    std::error_code ec{};
    if (!std::filesystem::is_directory(storageDir, ec))
    {
        throw StorageIOError("storage: not a directory: " + storageDir.string());
    }
    return std::make_unique<SqliteRecordStore>(storageDir / std::filesystem::path{ g_kDbFileName });
}

} // namespace notevault::storage::sqlite
