#ifndef INCLUDE_WIPECERT_STORAGE_ICERTIFICATELEDGER_HPP
#define INCLUDE_WIPECERT_STORAGE_ICERTIFICATELEDGER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wipecert::storage
{

inline constexpr std::string_view g_defaultLedgerFileName{ "wipecert_ledger.db" };

// One issued certificate, as remembered by the ledger.
struct LedgerEntry final
{
    std::string certificateId;
    std::uint64_t timestamp{ 0U };
    std::string devicePath;
    std::string mode;
    std::string schema;
    std::string hash;
    std::filesystem::path certificatePath;
    bool verificationPassed{ false };
};

class ICertificateLedger
{
public:
    ICertificateLedger() = default;
    ICertificateLedger(const ICertificateLedger&) = delete;
    ICertificateLedger& operator=(const ICertificateLedger&) = delete;
    ICertificateLedger(ICertificateLedger&&) = delete;
    ICertificateLedger& operator=(ICertificateLedger&&) = delete;
    virtual ~ICertificateLedger() = default;

    // Appends a row. Ids are not unique: basic ids repeat within one second.
    virtual void record(const LedgerEntry& entry) = 0;

    // Oldest first.
    [[nodiscard]] virtual std::vector<LedgerEntry> list() = 0;

    // Newest row carrying the id.
    [[nodiscard]] virtual std::optional<LedgerEntry> find(const std::string& certificateId) = 0;
};

} // namespace wipecert::storage

#endif // INCLUDE_WIPECERT_STORAGE_ICERTIFICATELEDGER_HPP
