#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include "wipecert/cert/CertificateIssuer.hpp"
#include "wipecert/cert/CertificateVerifier.hpp"
#include "wipecert/core/Errors.hpp"
#include "wipecert/core/StorageDevice.hpp"
#include "wipecert/crypto/KeyFile.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <fstream>
#include <glog/logging.h>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <variant>

namespace wipecert::ui::cli
{

namespace
{

constexpr std::uint64_t g_kBytesPerGiB{ 1024ULL * 1024ULL * 1024ULL };
constexpr std::string_view g_kConfirmWord{ "YES" };

[[nodiscard]] std::string yesNo(bool b)
{
    return b ? "Yes" : "No";
}

[[nodiscard]] std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

} // namespace

CommandLine::CommandLine(CommandLineServices services, std::istream& in, std::ostream& out, std::ostream& err,
                         wipecert::core::WipeEngineConfig engineConfig, wipecert::core::NowProvider now)
    : m_services(std::move(services)), m_in(in), m_out(out), m_err(err), m_engineConfig(engineConfig),
      m_now(now ? std::move(now) : wipecert::core::NowProvider{ &wipecert::core::unixSecondsNow })
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    CLI::App app{ "Certified secure erasure of storage devices" };
    app.name("wipecert");
    app.require_subcommand(1);
    app.set_config("--config", "", "Read options from an INI file");

    int exitCode{ g_exitSuccess };

    app.add_flag_callback("-v,--verbose", []() { FLAGS_v = 1; }, "Enable verbose logging");

    // LIST
    bool detailed{ false };
    auto* subList = app.add_subcommand("list", "List available storage devices");
    subList->add_flag("-d,--detailed", detailed, "Show detailed device information");
    subList->callback([&]() { exitCode = doList(detailed); });

    // WIPE
    WipeCommandOptions wipe{};
    std::string email;
    std::string ocspUrl;
    std::string crlUrl;
    std::string caChain;
    std::string ledger;
    auto* subWipe = app.add_subcommand("wipe", "Securely erase a storage device");
    subWipe->add_option("-d,--device", wipe.device, "Target device path")->required();
    subWipe->add_option("-m,--mode", wipe.mode, "Erase mode: quick, full or advanced")
        ->check(CLI::IsMember({ "quick", "full", "advanced" }, CLI::ignore_case))
        ->capture_default_str();
    subWipe->add_flag("-c,--certificate", wipe.certificate, "Issue a signed certificate after the wipe");
    subWipe->add_option("-o,--output", wipe.output, "Output directory for the certificate")->capture_default_str();
    subWipe->add_option("-k,--key", wipe.key, "Ed25519 private key (PEM)")->capture_default_str();
    subWipe->add_option("--schema", wipe.schema, "Certificate schema: basic or enhanced")
        ->check(CLI::IsMember({ "basic", "enhanced" }, CLI::ignore_case))
        ->capture_default_str();
    subWipe->add_option("--issuer-name", wipe.issuerName, "Issuer name")->capture_default_str();
    subWipe->add_option("--organization", wipe.organization, "Issuer organization");
    auto* emailOpt = subWipe->add_option("--email", email, "Issuer contact e-mail");
    auto* ocspOpt = subWipe->add_option("--ocsp-url", ocspUrl, "OCSP responder URL");
    auto* crlOpt = subWipe->add_option("--crl-url", crlUrl, "CRL distribution point URL");
    auto* caOpt = subWipe->add_option("--ca-chain", caChain, "PEM file with the CA chain")->check(CLI::ExistingFile);
    auto* ledgerOpt = subWipe->add_option("--ledger", ledger, "Record the certificate in this ledger database");
    subWipe->add_flag("-y,--yes", wipe.assumeYes, "Do not ask for confirmation");
    subWipe->callback(
        [&]()
        {
            if (*emailOpt)
            {
                wipe.email = email;
            }
            if (*ocspOpt)
            {
                wipe.ocspUrl = ocspUrl;
            }
            if (*crlOpt)
            {
                wipe.crlUrl = crlUrl;
            }
            if (*caOpt)
            {
                wipe.caChain = std::filesystem::path{ caChain };
            }
            if (*ledgerOpt)
            {
                wipe.ledger = std::filesystem::path{ ledger };
            }
            exitCode = doWipe(wipe);
        });

    // VERIFY
    std::string certificatePath;
    std::string publicKeyPath;
    bool noOcsp{ false };
    bool noCrl{ false };
    auto* subVerify = app.add_subcommand("verify", "Verify a wipe certificate");
    subVerify->add_option("-c,--certificate", certificatePath, "Path to the certificate file")
        ->required()
        ->check(CLI::ExistingFile);
    subVerify->add_option("-p,--public-key", publicKeyPath,
                          "Ed25519 public key (PEM), default: public_key.pem beside the certificate");
    subVerify->add_flag("--no-ocsp", noOcsp, "Skip the OCSP lookup");
    subVerify->add_flag("--no-crl", noCrl, "Skip the CRL lookup");
    subVerify->callback(
        [&]()
        {
            std::filesystem::path key{ publicKeyPath };
            if (key.empty())
            {
                key = std::filesystem::path{ certificatePath }.parent_path() /
                      std::filesystem::path{ wipecert::crypto::g_publicKeyFileName };
            }
            exitCode = doVerify(certificatePath, key, !noOcsp, !noCrl);
        });

    // GENERATE-KEYS
    std::string keyDir{ "." };
    auto* subKeys = app.add_subcommand("generate-keys", "Generate an Ed25519 signing key pair");
    subKeys->add_option("-o,--output", keyDir, "Output directory for the keys")->capture_default_str();
    subKeys->callback([&]() { exitCode = doGenerateKeys(keyDir); });

    // HISTORY
    std::string historyLedger{ wipecert::storage::g_defaultLedgerFileName };
    auto* subHistory = app.add_subcommand("history", "List certificates recorded in the ledger");
    subHistory->add_option("-l,--ledger", historyLedger, "Ledger database")->capture_default_str();
    subHistory->callback([&]() { exitCode = doHistory(historyLedger); });

    try
    {
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.emplace_back("wipecert");
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size());
        for (auto& arg : argvStorage)
        {
            argv.push_back(arg.data());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return (app.exit(e, m_out, m_err) == 0) ? g_exitSuccess : g_exitUsage;
    }
    return exitCode;
}

int CommandLine::doList(bool detailed)
{
    LOG(INFO) << "Scanning for available storage devices";

    std::vector<wipecert::core::StorageDevice> devices;
    try
    {
        devices = m_services.probe.listDevices();
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }

    if (devices.empty())
    {
        m_out << "No storage devices found.\n";
        return g_exitSuccess;
    }

    m_out << "Found " << devices.size() << " storage device(s):\n\n";
    std::size_t index{ 1 };
    for (const auto& device : devices)
    {
        m_out << index++ << ". " << device.name << "\n";
        m_out << "   Path: " << device.path << "\n";
        m_out << "   Size: " << device.size / g_kBytesPerGiB << " GB\n";
        m_out << "   Type: " << wipecert::core::toString(device.type) << "\n";
        if (detailed)
        {
            if (device.model.has_value())
            {
                m_out << "   Model: " << *device.model << "\n";
            }
            if (device.serial.has_value())
            {
                m_out << "   Serial: " << *device.serial << "\n";
            }
            if (device.firmwareVersion.has_value())
            {
                m_out << "   Firmware: " << *device.firmwareVersion << "\n";
            }
            if (device.interfaceType.has_value())
            {
                m_out << "   Interface: " << *device.interfaceType << "\n";
            }
            m_out << "   Secure Erase: " << yesNo(device.supportsSecureErase) << "\n";
            m_out << "   TRIM Support: " << yesNo(device.supportsTrim) << "\n";
            m_out << "   Crypto Erase: " << yesNo(device.supportsCryptoErase) << "\n";
            if (!device.hiddenAreas.empty())
            {
                m_out << "   Hidden Areas: " << device.hiddenAreas.size() << "\n";
                for (const auto& area : device.hiddenAreas)
                {
                    m_out << "     - " << area.description << ": " << area.size << " sectors\n";
                }
            }
        }
        m_out << "\n";
    }
    return g_exitSuccess;
}

int CommandLine::doWipe(const WipeCommandOptions& options)
{
    const auto mode = wipecert::core::parseEraseMode(options.mode);
    const auto schema = wipecert::cert::parseSchema(options.schema);
    if (!mode.has_value())
    {
        m_err << "Error: Invalid erase mode: " << options.mode << "\n";
        return g_exitUsage;
    }
    if (!schema.has_value())
    {
        m_err << "Error: Unknown certificate schema: " << options.schema << "\n";
        return g_exitUsage;
    }

    std::optional<wipecert::core::StorageDevice> device;
    try
    {
        auto devices = m_services.probe.listDevices();
        const auto it = std::find_if(devices.begin(), devices.end(),
                                     [&](const auto& d) { return d.path == options.device; });
        if (it != devices.end())
        {
            device = std::move(*it);
        }
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }
    if (!device.has_value())
    {
        m_err << "Error: Device not found: " << options.device << "\n";
        return g_exitFailure;
    }

    // Load the key before destroying anything so a bad key cannot leave an uncertified wipe behind.
    std::optional<wipecert::crypto::SigningKey> key;
    wipecert::cert::IssuerConfig issuerConfig{};
    if (options.certificate)
    {
        lockProcessMemory();
        try
        {
            key = wipecert::crypto::loadSigningKey(std::filesystem::path{ options.key }, m_services.crypto);
            if (options.caChain.has_value())
            {
                issuerConfig.caChainPem = readTextFile(*options.caChain);
            }
        }
        catch (const std::exception& e)
        {
            m_err << "Error: " << e.what() << "\n";
            return g_exitFailure;
        }
        issuerConfig.identity.name = options.issuerName;
        issuerConfig.identity.organization = options.organization;
        issuerConfig.identity.email = options.email;
        issuerConfig.ocspUrl = options.ocspUrl;
        issuerConfig.crlUrl = options.crlUrl;
    }

    m_out << "WARNING: This operation will permanently destroy all data on the device!\n";
    m_out << "Device: " << device->name << " (" << device->path << ")\n";
    m_out << "Size: " << device->size / g_kBytesPerGiB << " GB\n";
    m_out << "Mode: " << wipecert::core::toString(*mode) << "\n\n";

    if (!options.assumeYes && !confirmDestruction(m_in, m_out, g_kConfirmWord))
    {
        m_out << "Operation cancelled.\n";
        return g_exitFailure;
    }

    auto lease = m_locks.tryAcquire(device->path);
    if (!lease.has_value())
    {
        m_err << "Error: Another wipe of " << device->path << " is in progress\n";
        return g_exitFailure;
    }

    LOG(INFO) << "Starting wipe operation on device: " << device->path;
    wipecert::core::WipeEngine engine{ m_services.operations, m_engineConfig, m_now };
    auto erased = engine.erase(*device, *mode);
    if (const auto* failure = std::get_if<wipecert::core::Failure>(&erased))
    {
        m_err << "Error: " << wipecert::core::describe(*failure) << "\n";
        return g_exitFailure;
    }
    const auto& result = std::get<wipecert::core::WipeResult>(erased);

    m_out << "Wipe operation completed!\n";
    m_out << "Duration: " << result.durationSeconds << " seconds\n";
    m_out << "Bytes written: " << result.bytesWritten / g_kBytesPerGiB << " GB\n";
    m_out << "Verification: " << (result.verificationPassed ? "PASSED" : "FAILED") << "\n";
    if (!result.errors.empty())
    {
        LOG(WARNING) << "Errors encountered during wipe:";
        for (const auto& error : result.errors)
        {
            LOG(WARNING) << "  - " << error;
        }
    }

    if (!key.has_value())
    {
        return g_exitSuccess;
    }

    std::unique_ptr<wipecert::storage::ICertificateLedger> ledger;
    if (options.ledger.has_value())
    {
        try
        {
            ledger = m_services.openLedger(*options.ledger);
        }
        catch (const std::exception& e)
        {
            m_err << "Error: " << e.what() << "\n";
            return g_exitFailure;
        }
    }

    const auto certificatePath =
        std::filesystem::path{ options.output } / std::filesystem::path{ wipecert::cert::g_certificateFileName };
    wipecert::cert::CertificateIssuer issuer{ m_services.crypto, std::move(issuerConfig), m_now };
    const auto issued = issuer.issueToFile(result, *key, *schema, certificatePath, ledger.get());
    if (const auto* failure = std::get_if<wipecert::core::Failure>(&issued))
    {
        m_err << "Error: " << wipecert::core::describe(*failure) << "\n";
        return g_exitFailure;
    }

    const auto& certificate = std::get<wipecert::cert::IssuedCertificate>(issued).certificate;
    m_out << "Certificate generated:\n";
    m_out << "  ID: " << wipecert::cert::certificateId(certificate) << "\n";
    m_out << "  JSON: " << certificatePath.string() << "\n";
    return g_exitSuccess;
}

int CommandLine::doVerify(const std::filesystem::path& certificate, const std::filesystem::path& publicKey,
                          bool enableOcsp, bool enableCrl)
{
    LOG(INFO) << "Verifying certificate: " << certificate.string();

    const wipecert::cert::CertificateVerifier verifier{
        m_services.crypto, wipecert::cert::VerifierOptions{ .enableOcsp = enableOcsp, .enableCrl = enableCrl },
        nullptr, m_now
    };
    try
    {
        const auto result = verifier.verifyFile(certificate, publicKey);
        m_out << wipecert::cert::formatReport(result);
        return result.isValid ? g_exitSuccess : g_exitFailure;
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }
}

int CommandLine::doGenerateKeys(const std::filesystem::path& outputDir)
{
    LOG(INFO) << "Generating Ed25519 key pair";
    try
    {
        const auto key = m_services.crypto.generateKeyPair();
        const auto paths = wipecert::crypto::writeKeyPair(outputDir, key);

        m_out << "Key pair generated successfully:\n";
        m_out << "  Private key: " << paths.privateKey.string() << "\n";
        m_out << "  Public key: " << paths.publicKey.string() << "\n\n";
        m_out << "IMPORTANT: Keep your private key secure and never share it!\n";
        m_out << "The public key can be shared for certificate verification.\n";
        return g_exitSuccess;
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }
}

int CommandLine::doHistory(const std::filesystem::path& ledgerPath)
{
    try
    {
        auto ledger = m_services.openLedger(ledgerPath);
        const auto entries = ledger->list();
        if (entries.empty())
        {
            m_out << "No certificates recorded.\n";
            return g_exitSuccess;
        }

        m_out << entries.size() << " certificate(s) recorded:\n";
        for (const auto& entry : entries)
        {
            m_out << "  " << entry.certificateId << "  " << entry.timestamp << "  " << entry.devicePath << "  "
                  << entry.mode << "  " << entry.schema << "  " << (entry.verificationPassed ? "PASSED" : "FAILED")
                  << "  " << entry.certificatePath.string() << "\n";
        }
        return g_exitSuccess;
    }
    catch (const std::exception& e)
    {
        m_err << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }
}

} // namespace wipecert::ui::cli
