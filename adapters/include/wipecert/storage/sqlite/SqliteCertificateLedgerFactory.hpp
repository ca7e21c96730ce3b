#ifndef INCLUDE_WIPECERT_STORAGE_SQLITE_SQLITECERTIFICATELEDGERFACTORY_HPP
#define INCLUDE_WIPECERT_STORAGE_SQLITE_SQLITECERTIFICATELEDGERFACTORY_HPP

#include "wipecert/storage/ICertificateLedger.hpp"
#include <filesystem>
#include <memory>

namespace wipecert::storage::sqlite
{

// Opens (creating when missing) the ledger database at `dbPath`. Throws std::runtime_error on SQLite errors.
[[nodiscard]] std::unique_ptr<wipecert::storage::ICertificateLedger>
makeSqliteCertificateLedger(const std::filesystem::path& dbPath);

} // namespace wipecert::storage::sqlite

#endif // INCLUDE_WIPECERT_STORAGE_SQLITE_SQLITECERTIFICATELEDGERFACTORY_HPP
