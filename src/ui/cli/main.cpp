#include "CommandLine.hpp"

#include "wipecert/crypto/providers/NativeProviderFactory.hpp"
#include "wipecert/device/linux/LinuxDeviceFactory.hpp"
#include "wipecert/storage/sqlite/SqliteCertificateLedgerFactory.hpp"
#include <glog/logging.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    try
    {
        auto crypto{ wipecert::crypto::providers::makeNativeCryptoProvider() };
        auto probe{ wipecert::device::makeLinuxDeviceProbe() };
        auto operations{ wipecert::device::makeLinuxDeviceOperations() };

        wipecert::ui::cli::CommandLine commandLine{
            wipecert::ui::cli::CommandLineServices{
                .probe = *probe,
                .operations = *operations,
                .crypto = *crypto,
                .openLedger = [](const std::filesystem::path& path)
                { return wipecert::storage::sqlite::makeSqliteCertificateLedger(path); },
            },
            std::cin, std::cout, std::cerr
        };

        const std::vector<std::string> args(argv + 1, argv + argc);
        return commandLine.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return wipecert::ui::cli::g_exitFailure;
    }
}
