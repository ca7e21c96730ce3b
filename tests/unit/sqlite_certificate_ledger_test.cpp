#include "wipecert/storage/sqlite/SqliteCertificateLedgerFactory.hpp"

#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace
{

wipecert::storage::LedgerEntry makeEntry(std::string id, std::uint64_t timestamp)
{
    return wipecert::storage::LedgerEntry{
        .certificateId = std::move(id),
        .timestamp = timestamp,
        .devicePath = "/dev/sdb",
        .mode = "Full",
        .schema = "enhanced",
        .hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
        .certificatePath = "/var/lib/wipecert/wipe_certificate.json",
        .verificationPassed = true,
    };
}

class SqliteCertificateLedgerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
    }

    [[nodiscard]] std::filesystem::path dbPath() const
    {
        return m_dir.path() / "state" / std::string{ wipecert::storage::g_defaultLedgerFileName };
    }

    wipecert::test_utils::TempDir m_dir{ "ledger_" };
};

} // namespace

TEST_F(SqliteCertificateLedgerTest, NewLedgerIsEmptyAndCreatesParentDirectory)
{
    auto ledger{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
    EXPECT_TRUE(std::filesystem::exists(dbPath()));
    EXPECT_TRUE(ledger->list().empty());
    EXPECT_FALSE(ledger->find("WIPE_0000000000000001").has_value());
}

TEST_F(SqliteCertificateLedgerTest, RecordsAreListedOldestFirst)
{
    auto ledger{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
    ledger->record(makeEntry("WIPE_B", 200U));
    ledger->record(makeEntry("WIPE_A", 100U));
    ledger->record(makeEntry("WIPE_C", 200U));

    const auto entries{ ledger->list() };
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[0].certificateId, "WIPE_A");
    EXPECT_EQ(entries[1].certificateId, "WIPE_B");
    EXPECT_EQ(entries[2].certificateId, "WIPE_C");
}

TEST_F(SqliteCertificateLedgerTest, FindReturnsEveryColumn)
{
    auto ledger{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
    auto entry{ makeEntry("WIPE_000000006553F100_7", wipecert::test_utils::g_kFixedNow) };
    entry.verificationPassed = false;
    entry.schema = "basic";
    ledger->record(entry);

    const auto found{ ledger->find("WIPE_000000006553F100_7") };
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->timestamp, wipecert::test_utils::g_kFixedNow);
    EXPECT_EQ(found->devicePath, "/dev/sdb");
    EXPECT_EQ(found->mode, "Full");
    EXPECT_EQ(found->schema, "basic");
    EXPECT_EQ(found->hash, entry.hash);
    EXPECT_EQ(found->certificatePath, entry.certificatePath);
    EXPECT_FALSE(found->verificationPassed);
}

TEST_F(SqliteCertificateLedgerTest, SameIdFromTwoWipesKeepsBothRows)
{
    auto ledger{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
    auto first{ makeEntry("WIPE_0000000065000000", 0x65000000U) };
    first.devicePath = "/dev/sda";
    auto second{ makeEntry("WIPE_0000000065000000", 0x65000000U) };
    second.devicePath = "/dev/sdb";
    ledger->record(first);
    ledger->record(second);

    const auto entries{ ledger->list() };
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].devicePath, "/dev/sda");
    EXPECT_EQ(entries[1].devicePath, "/dev/sdb");

    const auto found{ ledger->find("WIPE_0000000065000000") };
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->devicePath, "/dev/sdb");
}

TEST_F(SqliteCertificateLedgerTest, RowsSurviveReopening)
{
    {
        auto ledger{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
        ledger->record(makeEntry("WIPE_A", 100U));
    }
    auto reopened{ wipecert::storage::sqlite::makeSqliteCertificateLedger(dbPath()) };
    EXPECT_TRUE(reopened->find("WIPE_A").has_value());
}

TEST_F(SqliteCertificateLedgerTest, DirectoryInPlaceOfDatabaseThrows)
{
    const auto blocked{ m_dir.path() / "blocked.db" };
    std::filesystem::create_directories(blocked);
    EXPECT_THROW(static_cast<void>(wipecert::storage::sqlite::makeSqliteCertificateLedger(blocked)),
                 std::runtime_error);
}
