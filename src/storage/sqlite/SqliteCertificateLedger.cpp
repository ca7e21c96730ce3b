#include "wipecert/storage/sqlite/SqliteCertificateLedgerFactory.hpp"

#include "wipecert/storage/ICertificateLedger.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace wipecert::storage::sqlite
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

constexpr const char* g_kSelectColumns{ "SELECT certificate_id, timestamp, device_path, mode, schema, hash,"
                                        " certificate_path, verification_passed FROM certificates" };

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "ledger: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "ledger: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const std::string& sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql.c_str(), -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "ledger: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value, const char* what)
{
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value, const char* what)
{
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = sqlite3_column_text(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    if (text == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

[[nodiscard]] LedgerEntry readRow(sqlite3_stmt* stmt)
{
    LedgerEntry entry{};
    entry.certificateId = columnText(stmt, 0);
    entry.timestamp = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
    entry.devicePath = columnText(stmt, 2);
    entry.mode = columnText(stmt, 3);
    entry.schema = columnText(stmt, 4);
    entry.hash = columnText(stmt, 5);
    entry.certificatePath = std::filesystem::path{ columnText(stmt, 6) };
    entry.verificationPassed = sqlite3_column_int(stmt, 7) != 0;
    return entry;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS certificates ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " certificate_id TEXT NOT NULL,"
             " timestamp INTEGER NOT NULL,"
             " device_path TEXT NOT NULL,"
             " mode TEXT NOT NULL,"
             " schema TEXT NOT NULL,"
             " hash TEXT NOT NULL,"
             " certificate_path TEXT NOT NULL,"
             " verification_passed INTEGER NOT NULL"
             ");");
    exec(db, "CREATE INDEX IF NOT EXISTS certificates_by_id ON certificates(certificate_id);");
}

class SqliteCertificateLedger final : public wipecert::storage::ICertificateLedger
{
public:
    explicit SqliteCertificateLedger(std::filesystem::path dbPath) : m_dbPath{ std::move(dbPath) }
    {
        if (m_dbPath.has_parent_path())
        {
            std::error_code ec{};
            std::filesystem::create_directories(m_dbPath.parent_path(), ec);
            if (ec)
            {
                throw std::runtime_error("ledger: failed to create directory: " + ec.message());
            }
        }
        auto db = openDb(m_dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        ensureSchema(db.get());
    }

    void record(const LedgerEntry& entry) override
    {
        auto db = openDb(m_dbPath, SQLITE_OPEN_READWRITE);
        auto stmt = prepare(db.get(), "INSERT INTO certificates(certificate_id, timestamp, device_path,"
                                      " mode, schema, hash, certificate_path, verification_passed)"
                                      " VALUES (?, ?, ?, ?, ?, ?, ?, ?);");

        const std::string certificatePath = entry.certificatePath.string();
        bindText(db.get(), stmt.get(), 1, entry.certificateId, "ledger: bind certificate_id failed");
        bindInt64(db.get(), stmt.get(), 2, static_cast<std::int64_t>(entry.timestamp), "ledger: bind timestamp failed");
        bindText(db.get(), stmt.get(), 3, entry.devicePath, "ledger: bind device_path failed");
        bindText(db.get(), stmt.get(), 4, entry.mode, "ledger: bind mode failed");
        bindText(db.get(), stmt.get(), 5, entry.schema, "ledger: bind schema failed");
        bindText(db.get(), stmt.get(), 6, entry.hash, "ledger: bind hash failed");
        bindText(db.get(), stmt.get(), 7, certificatePath, "ledger: bind certificate_path failed");
        bindInt64(db.get(), stmt.get(), 8, entry.verificationPassed ? 1 : 0,
                  "ledger: bind verification_passed failed");

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db.get(), "ledger: insert failed"));
        }
    }

    [[nodiscard]] std::vector<LedgerEntry> list() override
    {
        auto db = openDb(m_dbPath, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), std::string{ g_kSelectColumns } + " ORDER BY timestamp ASC, id ASC;");

        std::vector<LedgerEntry> out{};
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            out.push_back(readRow(stmt.get()));
        }
        if (rc != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db.get(), "ledger: select failed"));
        }
        return out;
    }

    [[nodiscard]] std::optional<LedgerEntry> find(const std::string& certificateId) override
    {
        auto db = openDb(m_dbPath, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), std::string{ g_kSelectColumns } + " WHERE certificate_id = ?"
                                                                  " ORDER BY timestamp DESC, id DESC LIMIT 1;");
        bindText(db.get(), stmt.get(), 1, certificateId, "ledger: bind certificate_id failed");

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            return readRow(stmt.get());
        }
        if (rc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        throw std::runtime_error(sqliteErr(db.get(), "ledger: select failed"));
    }

private:
    std::filesystem::path m_dbPath;
};

} // namespace

std::unique_ptr<wipecert::storage::ICertificateLedger> makeSqliteCertificateLedger(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteCertificateLedger>(dbPath);
}

} // namespace wipecert::storage::sqlite
