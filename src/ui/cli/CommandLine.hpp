#ifndef WIPECERT_UI_CLI_COMMANDLINE_HPP
#define WIPECERT_UI_CLI_COMMANDLINE_HPP

#include "wipecert/core/Clock.hpp"
#include "wipecert/core/DeviceLockRegistry.hpp"
#include "wipecert/core/WipeEngine.hpp"
#include "wipecert/crypto/ICryptoProvider.hpp"
#include "wipecert/crypto/KeyFile.hpp"
#include "wipecert/device/IDeviceOperations.hpp"
#include "wipecert/device/IDeviceProbe.hpp"
#include "wipecert/storage/ICertificateLedger.hpp"

#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wipecert::ui::cli
{

inline constexpr int g_exitSuccess{ 0 };
inline constexpr int g_exitFailure{ 1 };
inline constexpr int g_exitUsage{ 2 };

// In tests: returns an in-memory or temp-dir ledger.
using LedgerOpener = std::function<std::unique_ptr<wipecert::storage::ICertificateLedger>(const std::filesystem::path&)>;

struct CommandLineServices final
{
    wipecert::device::IDeviceProbe& probe;
    wipecert::device::IDeviceOperations& operations;
    wipecert::crypto::ICryptoProvider& crypto;
    LedgerOpener openLedger;
};

struct WipeCommandOptions final
{
    std::string device;
    std::string mode{ "full" };
    bool certificate{ false };
    std::string output{ "." };
    std::string key{ wipecert::crypto::g_privateKeyFileName };
    std::string schema{ "enhanced" };
    std::string issuerName{ "wipecert" };
    std::string organization;
    std::optional<std::string> email;
    std::optional<std::string> ocspUrl;
    std::optional<std::string> crlUrl;
    std::optional<std::filesystem::path> caChain;
    std::optional<std::filesystem::path> ledger;
    bool assumeYes{ false };
};

// `wipecert` front end: parses one invocation with CLI11 and dispatches to the services.
class CommandLine final
{
public:
    CommandLine(CommandLineServices services, std::istream& in, std::ostream& out, std::ostream& err,
                wipecert::core::WipeEngineConfig engineConfig = {}, wipecert::core::NowProvider now = {});

    // `args` excludes the program name. Returns the process exit status.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    CommandLineServices m_services;
    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;
    wipecert::core::WipeEngineConfig m_engineConfig;
    wipecert::core::NowProvider m_now;
    wipecert::core::DeviceLockRegistry m_locks;

    [[nodiscard]] int doList(bool detailed);
    [[nodiscard]] int doWipe(const WipeCommandOptions& options);
    [[nodiscard]] int doVerify(const std::filesystem::path& certificate, const std::filesystem::path& publicKey,
                               bool enableOcsp, bool enableCrl);
    [[nodiscard]] int doGenerateKeys(const std::filesystem::path& outputDir);
    [[nodiscard]] int doHistory(const std::filesystem::path& ledgerPath);
};

} // namespace wipecert::ui::cli

#endif // WIPECERT_UI_CLI_COMMANDLINE_HPP
